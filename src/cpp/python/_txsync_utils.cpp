#include <txsync/python/txsync_nanobind.h>
#include <txsync/util/lifecycle.h>

void export_utils(nb::module_ &m) {
    using namespace txsync;

    // Expose date/time constants
    m.attr("MIN_DT") = MIN_DT;
    m.attr("MAX_DT") = MAX_DT;
    m.attr("MIN_TD") = MIN_TD;

    nb::class_<ComponentLifeCycle>(m, "ComponentLifeCycle")
        .def_prop_ro("is_initialised", &ComponentLifeCycle::is_initialised)
        .def_prop_ro("is_started", &ComponentLifeCycle::is_started)
        .def("start", [](ComponentLifeCycle &self) { start_component(self); })
        .def("stop", [](ComponentLifeCycle &self) { stop_component(self); })
        .def("dispose", [](ComponentLifeCycle &self) { dispose_component(self); });
}

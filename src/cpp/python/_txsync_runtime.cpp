/*
 * Expose the clocks, trace and engine facade to python
 */
#include <txsync/python/txsync_nanobind.h>
#include <txsync/runtime/observers/reconciliation_trace.h>
#include <txsync/runtime/reconciliation_engine.h>

void export_runtime(nb::module_ &m) {
    using namespace txsync;

    nb::class_<EvaluationClock>(m, "EvaluationClock")
        .def_prop_ro("now", &EvaluationClock::now)
        .def_prop_ro("next_alarm_time", &EvaluationClock::next_alarm_time)
        .def("has_alarm", &EvaluationClock::has_alarm, "name"_a)
        .def("cancel_alarm", &EvaluationClock::cancel_alarm, "name"_a);

    nb::class_<BaseEvaluationClock, EvaluationClock>(m, "BaseEvaluationClock")
        .def_prop_ro("alarm_count", &BaseEvaluationClock::alarm_count);

    nb::class_<SimulationEvaluationClock, BaseEvaluationClock>(m, "SimulationEvaluationClock")
        .def(nb::init<engine_time_t>(), "start_time"_a)
        .def("advance", &SimulationEvaluationClock::advance, "delta"_a)
        .def("advance_to", &SimulationEvaluationClock::advance_to, "time"_a);

    nb::class_<RealTimeEvaluationClock, BaseEvaluationClock>(m, "RealTimeEvaluationClock")
        .def(nb::init<>())
        .def("run_until_next_alarm", &RealTimeEvaluationClock::run_until_next_alarm, "max_wait"_a,
             nb::call_guard<nb::gil_scoped_release>())
        .def("wake", &RealTimeEvaluationClock::wake);

    nb::class_<ReconciliationObserver>(m, "ReconciliationObserver");

    nb::class_<ReconciliationTrace, ReconciliationObserver>(m, "ReconciliationTrace")
        .def(nb::init<const std::optional<std::string> &, bool, bool, bool, bool, bool>(), "filter"_a = nb::none(),
             "mutation"_a = true, "poll"_a = true, "transaction"_a = true, "block"_a = true, "network"_a = true)
        .def_static("set_use_logger", &ReconciliationTrace::set_use_logger, "value"_a);

    nb::class_<ReconciliationEngine, ComponentLifeCycle>(m, "ReconciliationEngine")
        .def(nb::init<EvaluationClock::s_ptr>(), "clock"_a)
        .def_prop_ro("mutation_registry", &ReconciliationEngine::mutation_registry)
        .def_prop_ro("block_poll_interval", &ReconciliationEngine::block_poll_interval)
        .def_prop_ro("selected_contract", &ReconciliationEngine::selected_contract)
        .def("add_observer", &ReconciliationEngine::add_observer, "observer"_a)
        .def("remove_observer", &ReconciliationEngine::remove_observer, "observer"_a)
        .def("clear_contract", &ReconciliationEngine::clear_contract);
}

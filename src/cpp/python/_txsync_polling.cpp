/*
 * Expose the polling decisions, mutation registry and block-time estimator to python
 */
#include <txsync/python/txsync_nanobind.h>
#include <txsync/polling/block_time.h>
#include <txsync/polling/invalidation_map.h>
#include <txsync/polling/mutation_poll_registry.h>

#include <nanobind/operators.h>

namespace {
    using namespace txsync;

    // Python object identity stands in for the read cache's reference identity
    data_ref_t to_data_ref(nb::handle data) {
        if (data.is_none()) { return {}; }
        PyObject *ptr = data.ptr();
        Py_INCREF(ptr);
        return data_ref_t(ptr, [](PyObject *p) {
            nb::gil_scoped_acquire guard;
            Py_DECREF(p);
        });
    }
} // namespace

void export_polling(nb::module_ &m) {
    using namespace txsync;

    m.attr("POST_MUTATION_POLL_WINDOW") = POST_MUTATION_POLL_WINDOW;
    m.attr("POST_MUTATION_POLL_INTERVAL") = POST_MUTATION_POLL_INTERVAL;

    m.def("make_entity_key", &make_entity_key, "ecosystem"_a, "address"_a);

    nb::class_<MutationPreview>(m, "MutationPreview")
        .def(nb::init<>())
        .def("__init__", [](MutationPreview *self, std::string type, MutationPreview::args_t args) {
            new (self) MutationPreview{std::move(type), std::move(args)};
        }, "type"_a, "args"_a = MutationPreview::args_t{})
        .def_rw("type", &MutationPreview::type)
        .def_rw("args", &MutationPreview::args)
        .def(nb::self == nb::self);

    nb::class_<MutationPollRegistry>(m, "MutationPollRegistry")
        .def(nb::init<EvaluationClock::s_ptr>(), "clock"_a)
        .def("record_mutation", &MutationPollRegistry::record_mutation, "key"_a, "preview"_a = nb::none())
        .def("post_mutation_interval",
             [](MutationPollRegistry &self, const EntityKey &key, std::string_view query, nb::handle data,
                engine_time_t data_updated_at) {
                 return self.post_mutation_interval(key, query, to_data_ref(data), data_updated_at);
             }, "key"_a, "query"_a, "data"_a.none(), "data_updated_at"_a)
        .def("preview", &MutationPollRegistry::preview, "key"_a)
        .def("is_awaiting_update", &MutationPollRegistry::is_awaiting_update, "key"_a)
        .def("clear", &MutationPollRegistry::clear, "key"_a)
        .def("clear_all", &MutationPollRegistry::clear_all)
        .def("__len__", &MutationPollRegistry::size);

    m.def("compute_block_poll_interval",
          [](std::optional<double> avg) { return compute_block_poll_interval(avg); }, "avg_block_time_ms"_a.none());
    m.def("countdown_poll_interval", &countdown_poll_interval, "effect_at"_a, "now"_a);
    m.def("format_duration_estimate", &format_duration_estimate, "duration"_a);

    nb::enum_<EstimateConfidence>(m, "EstimateConfidence")
        .value("LOW", EstimateConfidence::LOW)
        .value("MEDIUM", EstimateConfidence::MEDIUM)
        .value("HIGH", EstimateConfidence::HIGH);

    nb::class_<BlockTimeEstimate>(m, "BlockTimeEstimate")
        .def_ro("avg_block_time_ms", &BlockTimeEstimate::avg_block_time_ms)
        .def_ro("sample_count", &BlockTimeEstimate::sample_count)
        .def_ro("is_calibrating", &BlockTimeEstimate::is_calibrating)
        .def_ro("confidence", &BlockTimeEstimate::confidence);

    nb::class_<BlockTimeEstimator>(m, "BlockTimeEstimator")
        .def(nb::init<>())
        .def("add_sample", &BlockTimeEstimator::add_sample, "block_number"_a, "timestamp"_a)
        .def("estimate", &BlockTimeEstimator::estimate)
        .def("estimated_duration", &BlockTimeEstimator::estimated_duration, "blocks"_a)
        .def("format_blocks_to_time", &BlockTimeEstimator::format_blocks_to_time, "blocks"_a)
        .def_prop_ro("is_fully_calibrated", &BlockTimeEstimator::is_fully_calibrated);

    auto mutation_type = nb::enum_<MutationType>(m, "MutationType");
    for (auto type: {MutationType::GRANT_ROLE, MutationType::REVOKE_ROLE, MutationType::RENOUNCE_ROLE,
                     MutationType::TRANSFER_OWNERSHIP, MutationType::ACCEPT_OWNERSHIP,
                     MutationType::RENOUNCE_OWNERSHIP, MutationType::TRANSFER_ADMIN, MutationType::ACCEPT_ADMIN,
                     MutationType::CANCEL_ADMIN, MutationType::CHANGE_ADMIN_DELAY,
                     MutationType::ROLLBACK_ADMIN_DELAY}) {
        mutation_type.value(to_string(type).data(), type);
    }

    m.def("invalidated_queries", [](MutationType type) { return invalidation_config(type).queries; }, "type"_a);
}

#include <txsync/runtime/observers/reconciliation_trace.h>
#include <txsync/util/string_utils.h>

#include <iostream>

namespace txsync {
    bool ReconciliationTrace::_use_logger = true;

    ReconciliationTrace::ReconciliationTrace(const std::optional<std::string> &filter, bool mutation, bool poll,
                                             bool transaction, bool block, bool network)
        : _filter(filter), _mutation(mutation), _poll(poll), _transaction(transaction), _block(block),
          _network(network) {
    }

    void ReconciliationTrace::set_use_logger(bool value) { _use_logger = value; }

    std::string ReconciliationTrace::format_event(engine_time_t when, std::string_view msg) {
        auto time_us = std::chrono::duration_cast<std::chrono::microseconds>(when.time_since_epoch()).count();
        return fmt::format("[{}] {}", time_us, msg);
    }

    void ReconciliationTrace::_print(engine_time_t when, const std::string &msg) const {
        if (_filter.has_value() && !contains(msg, *_filter)) { return; }
        auto formatted = format_event(when, msg);
        if (_use_logger) {
            std::cerr << formatted << std::endl;
        } else {
            std::cout << formatted << std::endl;
        }
    }

    void ReconciliationTrace::on_mutation_recorded(engine_time_t when, const EntityKey &key,
                                                   const std::optional<MutationPreview> &preview, bool coalesced) {
        if (!_mutation) { return; }
        _print(when, fmt::format("[{}] Mutation {}{}", key, preview ? preview->type : "<no preview>",
                                 coalesced ? " (coalesced)" : ""));
    }

    void ReconciliationTrace::on_invalidation(engine_time_t when, const EntityKey &key,
                                              std::string_view mutation_type,
                                              const std::vector<std::string> &queries, bool deferred) {
        if (!_mutation) { return; }
        _print(when, fmt::format("[{}] {} invalidate [{}]{}", key, mutation_type, fmt::join(queries, ", "),
                                 deferred ? " (deferred)" : ""));
    }

    void ReconciliationTrace::on_snapshot_captured(engine_time_t when, const EntityKey &key, std::string_view query) {
        if (!_poll) { return; }
        _print(when, fmt::format("[{}] Snapshot {}", key, query));
    }

    void ReconciliationTrace::on_poll_state_retired(engine_time_t when, const EntityKey &key,
                                                    PollRetireReason reason) {
        if (!_poll) { return; }
        _print(when, fmt::format("[{}] Stop polling: {}", key, to_string(reason)));
    }

    void ReconciliationTrace::on_transaction_step(engine_time_t when, std::string_view label, TransactionStep from,
                                                  TransactionStep to,
                                                  const std::optional<std::string> &error_message) {
        if (!_transaction) { return; }
        if (error_message) {
            _print(when, fmt::format("[{}] {} -> {}: {}", label, to_string(from), to_string(to), *error_message));
        } else {
            _print(when, fmt::format("[{}] {} -> {}", label, to_string(from), to_string(to)));
        }
    }

    void ReconciliationTrace::on_block_sample(engine_time_t when, std::string_view network_id, std::uint64_t block,
                                              std::size_t sample_count, std::optional<double> avg_block_time_ms) {
        if (!_block) { return; }
        if (avg_block_time_ms) {
            _print(when, fmt::format("[{}] Block {} ({} samples, avg {:.0f}ms)", network_id, block, sample_count,
                                     *avg_block_time_ms));
        } else {
            _print(when, fmt::format("[{}] Block {} ({} samples, calibrating)", network_id, block, sample_count));
        }
    }

    void ReconciliationTrace::on_calibration_state(engine_time_t when, std::string_view network_id, bool polling) {
        if (!_block) { return; }
        _print(when, fmt::format("[{}] Block polling {}", network_id, polling ? "started" : "stopped"));
    }

    void ReconciliationTrace::on_network_switch_state(engine_time_t when, NetworkSwitchState from,
                                                      NetworkSwitchState to,
                                                      const std::optional<std::string> &target_network_id) {
        if (!_network) { return; }
        _print(when, fmt::format("Network {} -> {} (target: {})", to_string(from), to_string(to),
                                 target_network_id.value_or("<none>")));
    }

    void ReconciliationTrace::on_network_switch_failed(engine_time_t when, std::string_view network_id,
                                                       std::string_view message) {
        if (!_network) { return; }
        _print(when, fmt::format("Network switch to {} failed: {}", network_id, message));
    }
} // namespace txsync

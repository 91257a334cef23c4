#include <txsync/runtime/observers/reconciliation_observer.h>
#include <txsync/runtime/evaluation_clock.h>

#include <algorithm>
#include <cstdio>

namespace txsync {
    std::string_view to_string(PollRetireReason reason) noexcept {
        switch (reason) {
            case PollRetireReason::DATA_CHANGED: return "data changed";
            case PollRetireReason::TIMED_OUT: return "timed out";
            case PollRetireReason::CLEARED: return "cleared";
        }
        return "unknown";
    }

    ObserverHub::ObserverHub(evaluation_clock_s_ptr clock) : _clock{std::move(clock)} {
        if (!_clock) { throw_error<std::invalid_argument>("ObserverHub requires a clock"); }
    }

    void ObserverHub::add_observer(ReconciliationObserver::s_ptr observer) {
        if (!observer) { return; }
        std::lock_guard<std::mutex> lock(_mutex);
        _observers.push_back(std::move(observer));
    }

    void ObserverHub::remove_observer(const ReconciliationObserver::s_ptr &observer) {
        std::lock_guard<std::mutex> lock(_mutex);
        _observers.erase(std::remove(_observers.begin(), _observers.end(), observer), _observers.end());
    }

    bool ObserverHub::empty() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _observers.empty();
    }

    std::size_t ObserverHub::size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _observers.size();
    }

    template<typename Fn>
    void ObserverHub::_notify(const char *event, Fn &&fn) const {
        std::vector<ReconciliationObserver::s_ptr> observers;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_observers.empty()) { return; }
            observers = _observers;
        }
        auto when = _clock->now();
        for (auto &observer: observers) {
            // An observer must never break the component reporting to it
            try {
                fn(*observer, when);
            } catch (const std::exception &e) {
                fprintf(stderr, "Warning: observer failed handling %s: %s\n", event, e.what());
            } catch (...) {
                fprintf(stderr, "Warning: observer failed handling %s with an unknown exception\n", event);
            }
        }
    }

    void ObserverHub::notify_mutation_recorded(const EntityKey &key, const std::optional<MutationPreview> &preview,
                                               bool coalesced) const {
        _notify("mutation_recorded", [&](ReconciliationObserver &o, engine_time_t when) {
            o.on_mutation_recorded(when, key, preview, coalesced);
        });
    }

    void ObserverHub::notify_invalidation(const EntityKey &key, std::string_view mutation_type,
                                          const std::vector<std::string> &queries, bool deferred) const {
        _notify("invalidation", [&](ReconciliationObserver &o, engine_time_t when) {
            o.on_invalidation(when, key, mutation_type, queries, deferred);
        });
    }

    void ObserverHub::notify_snapshot_captured(const EntityKey &key, std::string_view query) const {
        _notify("snapshot_captured", [&](ReconciliationObserver &o, engine_time_t when) {
            o.on_snapshot_captured(when, key, query);
        });
    }

    void ObserverHub::notify_poll_state_retired(const EntityKey &key, PollRetireReason reason) const {
        _notify("poll_state_retired", [&](ReconciliationObserver &o, engine_time_t when) {
            o.on_poll_state_retired(when, key, reason);
        });
    }

    void ObserverHub::notify_transaction_step(std::string_view label, TransactionStep from, TransactionStep to,
                                              const std::optional<std::string> &error_message) const {
        _notify("transaction_step", [&](ReconciliationObserver &o, engine_time_t when) {
            o.on_transaction_step(when, label, from, to, error_message);
        });
    }

    void ObserverHub::notify_block_sample(std::string_view network_id, std::uint64_t block, std::size_t sample_count,
                                          std::optional<double> avg_block_time_ms) const {
        _notify("block_sample", [&](ReconciliationObserver &o, engine_time_t when) {
            o.on_block_sample(when, network_id, block, sample_count, avg_block_time_ms);
        });
    }

    void ObserverHub::notify_calibration_state(std::string_view network_id, bool polling) const {
        _notify("calibration_state", [&](ReconciliationObserver &o, engine_time_t when) {
            o.on_calibration_state(when, network_id, polling);
        });
    }

    void ObserverHub::notify_network_switch_state(NetworkSwitchState from, NetworkSwitchState to,
                                                  const std::optional<std::string> &target_network_id) const {
        _notify("network_switch_state", [&](ReconciliationObserver &o, engine_time_t when) {
            o.on_network_switch_state(when, from, to, target_network_id);
        });
    }

    void ObserverHub::notify_network_switch_failed(std::string_view network_id, std::string_view message) const {
        _notify("network_switch_failed", [&](ReconciliationObserver &o, engine_time_t when) {
            o.on_network_switch_failed(when, network_id, message);
        });
    }
} // namespace txsync

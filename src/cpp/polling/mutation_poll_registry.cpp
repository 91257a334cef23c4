#include <txsync/polling/mutation_poll_registry.h>

#include <cstdio>

namespace txsync {
    void MutationPollingConfig::validate() const {
        if (poll_window.count() <= 0) {
            throw_error<std::invalid_argument>("poll_window must be positive, got {}ms", poll_window.count());
        }
        if (poll_interval.count() <= 0) {
            throw_error<std::invalid_argument>("poll_interval must be positive, got {}ms", poll_interval.count());
        }
        if (dedup_window.count() < 0) {
            throw_error<std::invalid_argument>("dedup_window must not be negative, got {}ms", dedup_window.count());
        }
    }

    MutationPollRegistry::MutationPollRegistry(EvaluationClock::s_ptr clock, MutationPollingConfig config,
                                               ObserverHub::s_ptr observers)
        : _clock{std::move(clock)}, _config{config}, _observers{std::move(observers)} {
        if (!_clock) { throw_error<std::invalid_argument>("MutationPollRegistry requires a clock"); }
        _config.validate();
    }

    void MutationPollRegistry::record_mutation(const EntityKey &key, std::optional<MutationPreview> preview) {
        bool coalesced{false};
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto now = _clock->now();
            auto it = _states.find(key);
            if (it == _states.end()) {
                _states.emplace(key, MutationPollState{now, std::move(preview), {}});
            } else if (now - it->second.timestamp < _config.dedup_window) {
                coalesced = true;
            } else {
                it->second.timestamp = now;
                if (preview) { it->second.preview = std::move(preview); }
            }
        }
        if (_observers) {
            _observers->notify_mutation_recorded(key, this->preview(key), coalesced);
        }
        if (!coalesced) { _notify_listeners(key); }
    }

    poll_interval_t MutationPollRegistry::post_mutation_interval(const EntityKey &key, std::string_view query_name,
                                                                 const data_ref_t &current_data,
                                                                 engine_time_t data_updated_at) {
        std::optional<PollRetireReason> retired;
        bool captured{false};
        poll_interval_t result;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            auto it = _states.find(key);
            if (it == _states.end()) { return std::nullopt; }

            auto &state = it->second;
            if (_clock->now() - state.timestamp > _config.poll_window) {
                _states.erase(it);
                retired = PollRetireReason::TIMED_OUT;
            } else if (data_updated_at <= state.timestamp) {
                // The cached read predates the write
                result = _config.poll_interval;
            } else {
                auto snapshot = state.snapshots.find(std::string{query_name});
                if (snapshot == state.snapshots.end()) {
                    // One fetch straight after the write may have raced it, so capture and keep polling
                    state.snapshots.emplace(std::string{query_name}, current_data);
                    captured = true;
                    result = _config.poll_interval;
                } else if (snapshot->second.get() == current_data.get()) {
                    result = _config.poll_interval;
                } else {
                    _states.erase(it);
                    retired = PollRetireReason::DATA_CHANGED;
                }
            }
        }

        if (captured && _observers) { _observers->notify_snapshot_captured(key, query_name); }
        if (retired) {
            if (_observers) { _observers->notify_poll_state_retired(key, *retired); }
            _notify_listeners(key);
        }
        return result;
    }

    std::optional<MutationPreview> MutationPollRegistry::preview(const EntityKey &key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _states.find(key);
        return it == _states.end() ? std::nullopt : it->second.preview;
    }

    bool MutationPollRegistry::is_awaiting_update(const EntityKey &key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _states.contains(key);
    }

    std::optional<MutationPollState> MutationPollRegistry::poll_state(const EntityKey &key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto it = _states.find(key);
        if (it == _states.end()) { return std::nullopt; }
        return it->second;
    }

    std::size_t MutationPollRegistry::size() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _states.size();
    }

    void MutationPollRegistry::clear(const EntityKey &key) {
        bool erased;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            erased = _states.erase(key) > 0;
        }
        if (!erased) { return; }
        if (_observers) { _observers->notify_poll_state_retired(key, PollRetireReason::CLEARED); }
        _notify_listeners(key);
    }

    void MutationPollRegistry::clear_all() {
        std::vector<EntityKey> keys;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            keys.reserve(_states.size());
            for (const auto &[key, _]: _states) { keys.push_back(key); }
            _states.clear();
        }
        for (const auto &key: keys) {
            if (_observers) { _observers->notify_poll_state_retired(key, PollRetireReason::CLEARED); }
            _notify_listeners(key);
        }
    }

    void MutationPollRegistry::subscribe(MutationPollStateListener::ptr listener) {
        std::lock_guard<std::mutex> lock(_listener_mutex);
        _listeners.subscribe(listener);
    }

    void MutationPollRegistry::un_subscribe(MutationPollStateListener::ptr listener) {
        std::lock_guard<std::mutex> lock(_listener_mutex);
        _listeners.un_subscribe(listener);
    }

    void MutationPollRegistry::_notify_listeners(const EntityKey &key) const {
        std::vector<MutationPollStateListener::ptr> listeners;
        {
            std::lock_guard<std::mutex> lock(_listener_mutex);
            listeners = _listeners.subscribers();
        }
        for (auto listener: listeners) {
            try {
                listener->on_poll_state_changed(key);
            } catch (const std::exception &e) {
                fprintf(stderr, "Warning: poll state listener failed for %s: %s\n", key.c_str(), e.what());
            }
        }
    }
} // namespace txsync

#include <txsync/runtime/evaluation_clock.h>

#include <algorithm>

namespace txsync {
    void BaseEvaluationClock::set_alarm(engine_time_t alarm_time, const std::string &name,
                                        alarm_callback_t callback) {
        if (alarm_time < now()) {
            throw_error<std::invalid_argument>("Cannot set alarm '{}' in the clock's past", name);
        }
        insert_alarm(alarm_time, name, std::move(callback));
    }

    void BaseEvaluationClock::set_alarm_after(engine_time_delta_t delay, const std::string &name,
                                              alarm_callback_t callback) {
        if (delay.count() < 0) {
            throw_error<std::invalid_argument>("Cannot set alarm '{}' with a negative delay", name);
        }
        insert_alarm(now() + delay, name, std::move(callback));
    }

    void BaseEvaluationClock::insert_alarm(engine_time_t alarm_time, const std::string &name,
                                           alarm_callback_t callback) {
        std::lock_guard<std::mutex> lock(_alarm_mutex);
        erase_alarm_locked(name);
        _alarms.emplace(alarm_time, name);
        _alarm_callbacks[{alarm_time, name}] = std::move(callback);
    }

    void BaseEvaluationClock::cancel_alarm(const std::string &name) {
        std::lock_guard<std::mutex> lock(_alarm_mutex);
        erase_alarm_locked(name);
    }

    bool BaseEvaluationClock::has_alarm(const std::string &name) const {
        std::lock_guard<std::mutex> lock(_alarm_mutex);
        return std::any_of(_alarms.begin(), _alarms.end(), [&name](const auto &alarm) { return alarm.second == name; });
    }

    engine_time_t BaseEvaluationClock::next_alarm_time() const {
        std::lock_guard<std::mutex> lock(_alarm_mutex);
        return _alarms.empty() ? MAX_DT : _alarms.begin()->first;
    }

    std::size_t BaseEvaluationClock::alarm_count() const {
        std::lock_guard<std::mutex> lock(_alarm_mutex);
        return _alarms.size();
    }

    std::optional<BaseEvaluationClock::due_alarm_t> BaseEvaluationClock::pop_due_alarm(engine_time_t until) {
        std::lock_guard<std::mutex> lock(_alarm_mutex);
        if (_alarms.empty() || _alarms.begin()->first > until) { return std::nullopt; }
        auto alarm = *_alarms.begin();
        _alarms.erase(_alarms.begin());
        auto cb = _alarm_callbacks.find(alarm);
        alarm_callback_t callback;
        if (cb != _alarm_callbacks.end()) {
            callback = std::move(cb->second);
            _alarm_callbacks.erase(cb);
        }
        return due_alarm_t{alarm.first, std::move(callback)};
    }

    std::size_t BaseEvaluationClock::fire_due_alarms(engine_time_t until) {
        std::size_t fired{0};
        while (auto alarm = pop_due_alarm(until)) {
            if (alarm->second) { alarm->second(alarm->first); }
            ++fired;
        }
        return fired;
    }

    void BaseEvaluationClock::erase_alarm_locked(const std::string &name) {
        for (auto it = _alarms.begin(); it != _alarms.end();) {
            if (it->second == name) {
                _alarm_callbacks.erase(*it);
                it = _alarms.erase(it);
            } else {
                ++it;
            }
        }
    }

    SimulationEvaluationClock::SimulationEvaluationClock(engine_time_t start_time) : _current_time{start_time} {
    }

    engine_time_t SimulationEvaluationClock::now() const {
        std::lock_guard<std::mutex> lock(_time_mutex);
        return _current_time;
    }

    std::size_t SimulationEvaluationClock::advance(engine_time_delta_t delta) { return advance_to(now() + delta); }

    std::size_t SimulationEvaluationClock::advance_to(engine_time_t time) {
        if (time < now()) { throw_error<std::invalid_argument>("Simulation clock cannot move backwards"); }
        std::size_t fired{0};
        while (auto alarm = pop_due_alarm(time)) {
            {
                std::lock_guard<std::mutex> lock(_time_mutex);
                _current_time = std::max(_current_time, alarm->first);
            }
            if (alarm->second) { alarm->second(alarm->first); }
            ++fired;
        }
        std::lock_guard<std::mutex> lock(_time_mutex);
        _current_time = time;
        return fired;
    }

    engine_time_t RealTimeEvaluationClock::now() const { return engine_now(); }

    void RealTimeEvaluationClock::set_alarm(engine_time_t alarm_time, const std::string &name,
                                            alarm_callback_t callback) {
        BaseEvaluationClock::set_alarm(alarm_time, name, std::move(callback));
        // The loop may be sleeping towards a later alarm
        wake();
    }

    void RealTimeEvaluationClock::set_alarm_after(engine_time_delta_t delay, const std::string &name,
                                                  alarm_callback_t callback) {
        BaseEvaluationClock::set_alarm_after(delay, name, std::move(callback));
        wake();
    }

    std::size_t RealTimeEvaluationClock::run_until_next_alarm(engine_time_delta_t max_wait) {
        auto deadline = std::min(next_alarm_time(), now() + max_wait);
        {
            std::unique_lock<std::mutex> lock(_condition_mutex);
            while (!_wake_requested) {
                auto current = now();
                if (current >= deadline) { break; }
                _wake_condition.wait_for(lock, deadline - current);
            }
            _wake_requested = false;
        }
        return fire_due_alarms(now());
    }

    void RealTimeEvaluationClock::wake() {
        {
            std::lock_guard<std::mutex> lock(_condition_mutex);
            _wake_requested = true;
        }
        _wake_condition.notify_all();
    }
} // namespace txsync

#ifndef TXSYNC_EVALUATION_CLOCK_H
#define TXSYNC_EVALUATION_CLOCK_H

#include <txsync/txsync_base.h>

#include <condition_variable>
#include <map>
#include <mutex>
#include <set>
#include <utility>

namespace txsync {
    using alarm_callback_t = std::function<void(engine_time_t)>;

    /**
     * The source of time for a session, and the owner of every deferred task (auto-close, polling, deferred
     * refetch). Deferred tasks are named alarms so that the component that set one can cancel it on reset/stop.
     */
    struct TXSYNC_EXPORT EvaluationClock {
        using ptr = EvaluationClock *;
        using s_ptr = std::shared_ptr<EvaluationClock>;

        virtual ~EvaluationClock() = default;

        [[nodiscard]] virtual engine_time_t now() const = 0;

        /**
         * Schedule ``callback`` to fire at ``alarm_time``. An existing alarm with the same name is replaced.
         * Throws std::invalid_argument if ``alarm_time`` is in the clock's past.
         */
        virtual void set_alarm(engine_time_t alarm_time, const std::string &name, alarm_callback_t callback) = 0;

        virtual void cancel_alarm(const std::string &name) = 0;

        [[nodiscard]] virtual bool has_alarm(const std::string &name) const = 0;

        /**
         * The time of the earliest pending alarm, MAX_DT when there is none.
         */
        [[nodiscard]] virtual engine_time_t next_alarm_time() const = 0;

        /**
         * Schedule ``callback`` to fire ``delay`` after now(). The alarm is never rejected as late, so a zero delay
         * fires on the next run of due alarms. Throws std::invalid_argument if ``delay`` is negative.
         */
        virtual void set_alarm_after(engine_time_delta_t delay, const std::string &name, alarm_callback_t callback) {
            set_alarm(now() + delay, name, std::move(callback));
        }
    };

    struct TXSYNC_EXPORT BaseEvaluationClock : EvaluationClock {
        void set_alarm(engine_time_t alarm_time, const std::string &name, alarm_callback_t callback) override;

        void set_alarm_after(engine_time_delta_t delay, const std::string &name, alarm_callback_t callback) override;

        void cancel_alarm(const std::string &name) override;

        [[nodiscard]] bool has_alarm(const std::string &name) const override;

        [[nodiscard]] engine_time_t next_alarm_time() const override;

        [[nodiscard]] std::size_t alarm_count() const;

    protected:
        using due_alarm_t = std::pair<engine_time_t, alarm_callback_t>;

        void insert_alarm(engine_time_t alarm_time, const std::string &name, alarm_callback_t callback);

        /**
         * Removes and returns the earliest alarm due at or before ``until``. The callback is handed back rather
         * than invoked so it runs without the alarm lock held (callbacks commonly schedule further alarms).
         */
        std::optional<due_alarm_t> pop_due_alarm(engine_time_t until);

        std::size_t fire_due_alarms(engine_time_t until);

    private:
        void erase_alarm_locked(const std::string &name);

        mutable std::mutex _alarm_mutex;
        std::set<std::pair<engine_time_t, std::string> > _alarms;
        std::map<std::pair<engine_time_t, std::string>, alarm_callback_t> _alarm_callbacks;
    };

    /**
     * A manually advanced clock. Time only moves when advance/advance_to is called, and alarms fire in time order
     * with now() equal to the alarm time while each callback runs.
     */
    struct TXSYNC_EXPORT SimulationEvaluationClock : BaseEvaluationClock {
        using s_ptr = std::shared_ptr<SimulationEvaluationClock>;

        explicit SimulationEvaluationClock(engine_time_t start_time);

        [[nodiscard]] engine_time_t now() const override;

        std::size_t advance(engine_time_delta_t delta);

        std::size_t advance_to(engine_time_t time);

    private:
        mutable std::mutex _time_mutex;
        engine_time_t _current_time;
    };

    /**
     * Wall-clock time. The owner of the session loop calls run_until_next_alarm repeatedly; it sleeps until the
     * next alarm is due, a new alarm is set, or wake() is called from another thread.
     */
    struct TXSYNC_EXPORT RealTimeEvaluationClock : BaseEvaluationClock {
        using s_ptr = std::shared_ptr<RealTimeEvaluationClock>;

        RealTimeEvaluationClock() = default;

        [[nodiscard]] engine_time_t now() const override;

        void set_alarm(engine_time_t alarm_time, const std::string &name, alarm_callback_t callback) override;

        void set_alarm_after(engine_time_delta_t delay, const std::string &name, alarm_callback_t callback) override;

        std::size_t run_until_next_alarm(engine_time_delta_t max_wait);

        void wake();

    private:
        std::mutex _condition_mutex;
        std::condition_variable _wake_condition;
        bool _wake_requested{false};
    };
} // namespace txsync

#endif  // TXSYNC_EVALUATION_CLOCK_H

#ifndef TXSYNC_RECONCILIATION_OBSERVER_H
#define TXSYNC_RECONCILIATION_OBSERVER_H

#include <txsync/txsync_base.h>
#include <txsync/network/network_switch_state.h>
#include <txsync/polling/polling_types.h>
#include <txsync/transaction/transaction_step.h>

#include <mutex>
#include <vector>

namespace txsync {
    enum class PollRetireReason {
        DATA_CHANGED,
        TIMED_OUT,
        CLEARED,
    };

    TXSYNC_EXPORT std::string_view to_string(PollRetireReason reason) noexcept;

    /**
     * Receives the events of the reconciliation components. All methods default to doing nothing so an observer
     * only needs to implement the events it cares about.
     */
    struct TXSYNC_EXPORT ReconciliationObserver {
        using ptr = ReconciliationObserver *;
        using s_ptr = std::shared_ptr<ReconciliationObserver>;

        virtual ~ReconciliationObserver() = default;

        virtual void on_mutation_recorded(engine_time_t when, const EntityKey &key,
                                          const std::optional<MutationPreview> &preview, bool coalesced) {
        }

        virtual void on_invalidation(engine_time_t when, const EntityKey &key, std::string_view mutation_type,
                                     const std::vector<std::string> &queries, bool deferred) {
        }

        virtual void on_snapshot_captured(engine_time_t when, const EntityKey &key, std::string_view query) {
        }

        virtual void on_poll_state_retired(engine_time_t when, const EntityKey &key, PollRetireReason reason) {
        }

        virtual void on_transaction_step(engine_time_t when, std::string_view label, TransactionStep from,
                                         TransactionStep to, const std::optional<std::string> &error_message) {
        }

        virtual void on_block_sample(engine_time_t when, std::string_view network_id, std::uint64_t block,
                                     std::size_t sample_count, std::optional<double> avg_block_time_ms) {
        }

        virtual void on_calibration_state(engine_time_t when, std::string_view network_id, bool polling) {
        }

        virtual void on_network_switch_state(engine_time_t when, NetworkSwitchState from, NetworkSwitchState to,
                                             const std::optional<std::string> &target_network_id) {
        }

        virtual void on_network_switch_failed(engine_time_t when, std::string_view network_id,
                                              std::string_view message) {
        }
    };

    /**
     * Fans events out to the registered observers, stamping each with the session clock's time. Components hold
     * an optional hub; a null hub means nobody is listening.
     */
    struct TXSYNC_EXPORT ObserverHub {
        using ptr = ObserverHub *;
        using s_ptr = std::shared_ptr<ObserverHub>;

        explicit ObserverHub(evaluation_clock_s_ptr clock);

        void add_observer(ReconciliationObserver::s_ptr observer);

        void remove_observer(const ReconciliationObserver::s_ptr &observer);

        [[nodiscard]] bool empty() const;

        [[nodiscard]] std::size_t size() const;

        void notify_mutation_recorded(const EntityKey &key, const std::optional<MutationPreview> &preview,
                                      bool coalesced) const;

        void notify_invalidation(const EntityKey &key, std::string_view mutation_type,
                                 const std::vector<std::string> &queries, bool deferred) const;

        void notify_snapshot_captured(const EntityKey &key, std::string_view query) const;

        void notify_poll_state_retired(const EntityKey &key, PollRetireReason reason) const;

        void notify_transaction_step(std::string_view label, TransactionStep from, TransactionStep to,
                                     const std::optional<std::string> &error_message) const;

        void notify_block_sample(std::string_view network_id, std::uint64_t block, std::size_t sample_count,
                                 std::optional<double> avg_block_time_ms) const;

        void notify_calibration_state(std::string_view network_id, bool polling) const;

        void notify_network_switch_state(NetworkSwitchState from, NetworkSwitchState to,
                                         const std::optional<std::string> &target_network_id) const;

        void notify_network_switch_failed(std::string_view network_id, std::string_view message) const;

    private:
        template<typename Fn>
        void _notify(const char *event, Fn &&fn) const;

        evaluation_clock_s_ptr _clock;
        mutable std::mutex _mutex;
        std::vector<ReconciliationObserver::s_ptr> _observers;
    };
} // namespace txsync

#endif  // TXSYNC_RECONCILIATION_OBSERVER_H

#ifndef TXSYNC_RECONCILIATION_TRACE_H
#define TXSYNC_RECONCILIATION_TRACE_H

#include <txsync/runtime/observers/reconciliation_observer.h>

namespace txsync {
    /**
     * @brief Logs out the reconciliation events as they happen.
     *
     * This is voluminous but can be helpful tracing down why a query kept (or stopped) polling, or why a
     * network switch never completed.
     */
    class TXSYNC_EXPORT ReconciliationTrace : public ReconciliationObserver {
    public:
        /**
         * @param filter Used to restrict which events to report (substring match on the formatted message)
         * @param mutation Log mutation recording and invalidation events
         * @param poll Log snapshot and poll-state retirement events
         * @param transaction Log transaction step changes
         * @param block Log block samples and calibration state
         * @param network Log network switch state changes and failures
         */
        explicit ReconciliationTrace(const std::optional<std::string> &filter = std::nullopt,
                                     bool mutation = true, bool poll = true, bool transaction = true,
                                     bool block = true, bool network = true);

        void on_mutation_recorded(engine_time_t when, const EntityKey &key,
                                  const std::optional<MutationPreview> &preview, bool coalesced) override;

        void on_invalidation(engine_time_t when, const EntityKey &key, std::string_view mutation_type,
                             const std::vector<std::string> &queries, bool deferred) override;

        void on_snapshot_captured(engine_time_t when, const EntityKey &key, std::string_view query) override;

        void on_poll_state_retired(engine_time_t when, const EntityKey &key, PollRetireReason reason) override;

        void on_transaction_step(engine_time_t when, std::string_view label, TransactionStep from,
                                 TransactionStep to, const std::optional<std::string> &error_message) override;

        void on_block_sample(engine_time_t when, std::string_view network_id, std::uint64_t block,
                             std::size_t sample_count, std::optional<double> avg_block_time_ms) override;

        void on_calibration_state(engine_time_t when, std::string_view network_id, bool polling) override;

        void on_network_switch_state(engine_time_t when, NetworkSwitchState from, NetworkSwitchState to,
                                     const std::optional<std::string> &target_network_id) override;

        void on_network_switch_failed(engine_time_t when, std::string_view network_id,
                                      std::string_view message) override;

        // Static configuration
        static void set_use_logger(bool value);

        /**
         * Formats a message exactly as it would be printed, exposed for tests and custom sinks.
         */
        [[nodiscard]] static std::string format_event(engine_time_t when, std::string_view msg);

    private:
        std::optional<std::string> _filter;
        bool _mutation;
        bool _poll;
        bool _transaction;
        bool _block;
        bool _network;

        static bool _use_logger;

        void _print(engine_time_t when, const std::string &msg) const;
    };
} // namespace txsync

#endif  // TXSYNC_RECONCILIATION_TRACE_H

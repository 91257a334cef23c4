#ifndef TXSYNC_RECONCILIATION_ENGINE_H
#define TXSYNC_RECONCILIATION_ENGINE_H

#include <txsync/network/network_switch_reconciler.h>
#include <txsync/polling/admin_info.h>
#include <txsync/polling/block_time.h>
#include <txsync/polling/invalidation_map.h>
#include <txsync/transaction/transaction_execution.h>
#include <txsync/util/lifecycle.h>

namespace txsync {
    struct TXSYNC_EXPORT ReconciliationEngineConfig {
        MutationPollingConfig polling;
        BlockTimeConfig block_time;
        BlockPollIntervalConfig block_poll;

        void validate() const;
    };

    /**
     * One session's reconciliation state: the shared clock, observers, mutation registry and block-time service,
     * plus factories binding the per-dialog and per-query components to them.
     *
     * Block-time calibration runs only while the engine is started and a contract is selected.
     */
    class TXSYNC_EXPORT ReconciliationEngine : public ComponentLifeCycle {
    public:
        explicit ReconciliationEngine(EvaluationClock::s_ptr clock, ReconciliationEngineConfig config = {});

        ~ReconciliationEngine() override;

        [[nodiscard]] const EvaluationClock::s_ptr &clock() const { return _clock; }

        [[nodiscard]] const ObserverHub::s_ptr &observers() const { return _observers; }

        [[nodiscard]] const MutationPollRegistry::s_ptr &mutation_registry() const { return _registry; }

        [[nodiscard]] const BlockTimeService &block_time() const { return *_block_time; }

        [[nodiscard]] const ReconciliationEngineConfig &config() const { return _config; }

        void add_observer(ReconciliationObserver::s_ptr observer);

        void remove_observer(const ReconciliationObserver::s_ptr &observer);

        void select_contract(const EntityKey &key, LedgerAdapter::s_ptr adapter);

        void clear_contract();

        [[nodiscard]] const std::optional<EntityKey> &selected_contract() const { return _selected_contract; }

        [[nodiscard]] millis_t block_poll_interval() const;

        [[nodiscard]] RefetchIntervalResolver<AdminInfo> admin_refetch_resolver() const;

        template<typename T>
        [[nodiscard]] RefetchIntervalResolver<T> post_mutation_resolver(std::string_view query_name) const {
            return make_post_mutation_resolver<T>(_registry, query_name);
        }

        [[nodiscard]] std::unique_ptr<InvalidationExecutor> make_invalidation_executor(
            QueryInvalidator::s_ptr invalidator) const;

        [[nodiscard]] NetworkSwitchReconciler::s_ptr make_network_reconciler(WalletStateController::s_ptr wallet,
                                                                             NetworkSwitcher::s_ptr switcher) const;

        template<typename Args>
        [[nodiscard]] typename TransactionExecution<Args>::s_ptr make_transaction_execution(
            typename MutationHandle<Args>::s_ptr mutation, TransactionExecutionOptions options = {}) const {
            return TransactionExecution<Args>::create(std::move(mutation), _clock, std::move(options), _observers);
        }

        [[nodiscard]] MultiMutationExecution::s_ptr make_multi_mutation_execution(
            MultiMutationExecutionOptions options = {}) const;

    protected:
        void initialise() override;

        void start() override;

        void stop() override;

        void dispose() override;

    private:
        EvaluationClock::s_ptr _clock;
        ReconciliationEngineConfig _config;
        ObserverHub::s_ptr _observers;
        MutationPollRegistry::s_ptr _registry;
        std::unique_ptr<BlockTimeService> _block_time;

        std::optional<EntityKey> _selected_contract;
        LedgerAdapter::s_ptr _adapter;
    };
} // namespace txsync

#endif  // TXSYNC_RECONCILIATION_ENGINE_H

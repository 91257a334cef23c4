#include <txsync/runtime/reconciliation_engine.h>

#include <cstdio>

namespace txsync {
    void ReconciliationEngineConfig::validate() const {
        polling.validate();
        block_time.validate();
        block_poll.validate();
    }

    ReconciliationEngine::ReconciliationEngine(EvaluationClock::s_ptr clock, ReconciliationEngineConfig config)
        : _clock{std::move(clock)}, _config{config} {
        if (!_clock) { throw_error<std::invalid_argument>("ReconciliationEngine requires a clock"); }
        _config.validate();
        _observers = std::make_shared<ObserverHub>(_clock);
        _registry = std::make_shared<MutationPollRegistry>(_clock, _config.polling, _observers);
        _block_time = std::make_unique<BlockTimeService>(_clock, _config.block_time, _config.block_poll, _observers);
    }

    ReconciliationEngine::~ReconciliationEngine() {
        try {
            dispose_component(*this);
        } catch (const std::exception &e) {
            fprintf(stderr, "Warning: exception disposing reconciliation engine: %s\n", e.what());
        }
    }

    void ReconciliationEngine::add_observer(ReconciliationObserver::s_ptr observer) {
        _observers->add_observer(std::move(observer));
    }

    void ReconciliationEngine::remove_observer(const ReconciliationObserver::s_ptr &observer) {
        _observers->remove_observer(observer);
    }

    void ReconciliationEngine::select_contract(const EntityKey &key, LedgerAdapter::s_ptr adapter) {
        _selected_contract = key;
        _adapter = std::move(adapter);
        if (is_started()) { _block_time->set_adapter(_adapter); }
    }

    void ReconciliationEngine::clear_contract() {
        _selected_contract.reset();
        _adapter.reset();
        _block_time->set_adapter(nullptr);
    }

    millis_t ReconciliationEngine::block_poll_interval() const { return _block_time->block_poll_interval(); }

    RefetchIntervalResolver<AdminInfo> ReconciliationEngine::admin_refetch_resolver() const {
        return make_admin_refetch_interval_resolver(_registry);
    }

    std::unique_ptr<InvalidationExecutor> ReconciliationEngine::make_invalidation_executor(
        QueryInvalidator::s_ptr invalidator) const {
        return std::make_unique<InvalidationExecutor>(_registry, std::move(invalidator));
    }

    NetworkSwitchReconciler::s_ptr ReconciliationEngine::make_network_reconciler(
        WalletStateController::s_ptr wallet, NetworkSwitcher::s_ptr switcher) const {
        return NetworkSwitchReconciler::create(std::move(wallet), std::move(switcher), _observers);
    }

    MultiMutationExecution::s_ptr ReconciliationEngine::make_multi_mutation_execution(
        MultiMutationExecutionOptions options) const {
        return MultiMutationExecution::create(_clock, std::move(options), _observers);
    }

    void ReconciliationEngine::initialise() {
    }

    void ReconciliationEngine::start() {
        if (_adapter) { _block_time->set_adapter(_adapter); }
    }

    void ReconciliationEngine::stop() { _block_time->set_adapter(nullptr); }

    void ReconciliationEngine::dispose() {
        _registry->clear_all();
        _selected_contract.reset();
        _adapter.reset();
    }
} // namespace txsync

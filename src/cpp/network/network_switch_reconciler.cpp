#include <txsync/network/network_switch_reconciler.h>
#include <txsync/util/string_utils.h>

namespace txsync {
    NetworkSwitchReconciler::s_ptr NetworkSwitchReconciler::create(WalletStateController::s_ptr wallet,
                                                                   NetworkSwitcher::s_ptr switcher,
                                                                   ObserverHub::s_ptr observers) {
        return s_ptr(new NetworkSwitchReconciler(std::move(wallet), std::move(switcher), std::move(observers)));
    }

    NetworkSwitchReconciler::NetworkSwitchReconciler(WalletStateController::s_ptr wallet,
                                                     NetworkSwitcher::s_ptr switcher, ObserverHub::s_ptr observers)
        : _wallet{std::move(wallet)}, _switcher{std::move(switcher)}, _observers{std::move(observers)} {
        if (!_wallet) { throw_error<std::invalid_argument>("NetworkSwitchReconciler requires a wallet controller"); }
    }

    void NetworkSwitchReconciler::on_selected_network_changed(const std::optional<std::string> &network_id) {
        if (_initialised && network_id == _last_synced) { return; }
        _initialised = true;

        _adapter_ready = false;
        _target = network_id;
        _last_synced = network_id;
        // Any switch still in flight was for the previous selection
        ++_switch_id;
        _set_state(_target ? NetworkSwitchState::TARGET_SET : NetworkSwitchState::IDLE);

        _wallet->set_active_network_id(network_id);
        _reconcile();
    }

    void NetworkSwitchReconciler::on_adapter_changed(const std::optional<AdapterSnapshot> &adapter) {
        _adapter = adapter;
        _reconcile();
    }

    void NetworkSwitchReconciler::on_wallet_reconnected(const std::string &chain_network_id) {
        if (_target || !_last_synced || chain_network_id == *_last_synced) { return; }
        _target = _last_synced;
        _adapter_ready = false;
        _set_state(NetworkSwitchState::TARGET_SET);
        _reconcile();
    }

    void NetworkSwitchReconciler::_reconcile() {
        if (_state == NetworkSwitchState::SWITCHING) { return; }
        if (!_target) {
            _adapter_ready = false;
            _set_state(NetworkSwitchState::IDLE);
            return;
        }
        if (!_adapter || _adapter->loading || _adapter->network_id != *_target || _last_synced != _target) {
            _adapter_ready = false;
            _set_state(NetworkSwitchState::WAITING_FOR_ADAPTER);
            return;
        }
        _adapter_ready = true;
        _set_state(NetworkSwitchState::READY);
        _begin_switch();
    }

    void NetworkSwitchReconciler::_begin_switch() {
        auto target = *_target;
        auto switch_id = ++_switch_id;
        if (!_switcher || !_switcher->supports_in_place_switch(target)) {
            _on_switch_complete(switch_id, nullptr);
            return;
        }
        _set_state(NetworkSwitchState::SWITCHING);
        std::weak_ptr<NetworkSwitchReconciler> weak = weak_from_this();
        try {
            _switcher->switch_network(target, [weak, switch_id](std::exception_ptr error) {
                if (auto self = weak.lock()) { self->_on_switch_complete(switch_id, std::move(error)); }
            });
        } catch (...) {
            _on_switch_complete(switch_id, std::current_exception());
        }
    }

    void NetworkSwitchReconciler::_on_switch_complete(std::uint64_t switch_id, std::exception_ptr error) {
        if (switch_id != _switch_id) { return; }
        if (error && _observers) {
            _observers->notify_network_switch_failed(_target.value_or(""), exception_message(error));
        }
        // No automatic retry, a later wallet reconnection re-queues the target
        _target.reset();
        _adapter_ready = false;
        _set_state(NetworkSwitchState::IDLE);
    }

    void NetworkSwitchReconciler::_set_state(NetworkSwitchState state) {
        if (state == _state) { return; }
        auto from = _state;
        _state = state;
        if (_observers) { _observers->notify_network_switch_state(from, state, _target); }
    }
} // namespace txsync

#ifndef TXSYNC_NETWORK_SWITCH_RECONCILER_H
#define TXSYNC_NETWORK_SWITCH_RECONCILER_H

#include <txsync/network/network_switch_state.h>
#include <txsync/runtime/observers/reconciliation_observer.h>

#include <exception>

namespace txsync {
    /**
     * What the read layer reports about the adapter it currently has active.
     */
    struct AdapterSnapshot {
        std::string network_id;
        bool loading{false};
    };

    /**
     * The wallet-side state owned by the host, asked to load the adapter for a network.
     */
    struct TXSYNC_EXPORT WalletStateController {
        using s_ptr = std::shared_ptr<WalletStateController>;

        virtual ~WalletStateController() = default;

        virtual void set_active_network_id(const std::optional<std::string> &network_id) = 0;
    };

    /**
     * Performs an explicit chain switch on the connected wallet.
     */
    struct TXSYNC_EXPORT NetworkSwitcher {
        using s_ptr = std::shared_ptr<NetworkSwitcher>;
        // Called once the switch finished, with the failure if it did not succeed
        using switch_callback_t = std::function<void(std::exception_ptr)>;

        virtual ~NetworkSwitcher() = default;

        /**
         * Only some chain families can change chain without a disconnect/reconnect.
         */
        [[nodiscard]] virtual bool supports_in_place_switch(const std::string &network_id) const = 0;

        virtual void switch_network(const std::string &network_id, switch_callback_t done) = 0;
    };

    /**
     * Sequences a network selection change so the read adapter and the wallet's active chain end up on the same
     * network:
     *
     *   idle -> target_set -> waiting_for_adapter -> ready -> switching -> idle
     *
     * Must be owned by a std::shared_ptr, switch callbacks hold a weak reference. Expected to be driven from the
     * session's single logical thread.
     */
    class TXSYNC_EXPORT NetworkSwitchReconciler : public std::enable_shared_from_this<NetworkSwitchReconciler> {
    public:
        using s_ptr = std::shared_ptr<NetworkSwitchReconciler>;

        static s_ptr create(WalletStateController::s_ptr wallet, NetworkSwitcher::s_ptr switcher,
                            ObserverHub::s_ptr observers = {});

        /**
         * The externally selected network changed (including the very first selection). Repeating the last
         * synced id is ignored.
         */
        void on_selected_network_changed(const std::optional<std::string> &network_id);

        void on_adapter_changed(const std::optional<AdapterSnapshot> &adapter);

        /**
         * The wallet reconnected on ``chain_network_id``. With no switch pending and a chain different from the
         * last requested network, the switch to that network is queued again.
         */
        void on_wallet_reconnected(const std::string &chain_network_id);

        [[nodiscard]] NetworkSwitchState state() const { return _state; }

        [[nodiscard]] const std::optional<std::string> &target_network_id() const { return _target; }

        [[nodiscard]] bool adapter_ready() const { return _adapter_ready; }

        [[nodiscard]] const std::optional<std::string> &last_synced_network_id() const { return _last_synced; }

    protected:
        NetworkSwitchReconciler(WalletStateController::s_ptr wallet, NetworkSwitcher::s_ptr switcher,
                                ObserverHub::s_ptr observers);

    private:
        void _reconcile();

        void _begin_switch();

        void _on_switch_complete(std::uint64_t switch_id, std::exception_ptr error);

        void _set_state(NetworkSwitchState state);

        WalletStateController::s_ptr _wallet;
        NetworkSwitcher::s_ptr _switcher;
        ObserverHub::s_ptr _observers;

        bool _initialised{false};
        std::optional<std::string> _last_synced;
        std::optional<std::string> _target;
        std::optional<AdapterSnapshot> _adapter;
        bool _adapter_ready{false};
        NetworkSwitchState _state{NetworkSwitchState::IDLE};
        // Identifies the in-flight switch; a newer selection abandons older completions
        std::uint64_t _switch_id{0};
    };
} // namespace txsync

#endif  // TXSYNC_NETWORK_SWITCH_RECONCILER_H

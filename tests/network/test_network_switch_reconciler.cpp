#include <catch2/catch_test_macros.hpp>

#include <txsync/network/network_switch_reconciler.h>

#include "../test_support.h"

using namespace txsync;
using namespace txsync::testing;

namespace {
    const std::string SEPOLIA{"ethereum-sepolia"};
    const std::string MAINNET{"ethereum-mainnet"};

    struct ReconcilerFixture {
        SimulationEvaluationClock::s_ptr clock{make_clock()};
        ObserverHub::s_ptr hub{std::make_shared<ObserverHub>(clock)};
        std::shared_ptr<RecordingObserver> observer{std::make_shared<RecordingObserver>()};
        std::shared_ptr<FakeWalletController> wallet{std::make_shared<FakeWalletController>()};
        std::shared_ptr<FakeNetworkSwitcher> switcher{std::make_shared<FakeNetworkSwitcher>()};
        NetworkSwitchReconciler::s_ptr reconciler;

        ReconcilerFixture() {
            hub->add_observer(observer);
            reconciler = NetworkSwitchReconciler::create(wallet, switcher, hub);
        }
    };

    struct ThrowingSwitcher : NetworkSwitcher {
        [[nodiscard]] bool supports_in_place_switch(const std::string &) const override { return true; }

        void switch_network(const std::string &, switch_callback_t) override {
            throw std::runtime_error("wallet disconnected");
        }
    };
} // namespace

TEST_CASE("a selection waits for its adapter before switching", "[network][reconciler]") {
    ReconcilerFixture f;

    f.reconciler->on_selected_network_changed(SEPOLIA);
    REQUIRE(f.wallet->requested == std::vector<std::optional<std::string> >{SEPOLIA});
    REQUIRE(f.reconciler->state() == NetworkSwitchState::WAITING_FOR_ADAPTER);
    REQUIRE(f.reconciler->target_network_id() == SEPOLIA);

    f.reconciler->on_adapter_changed(AdapterSnapshot{SEPOLIA, true});
    REQUIRE(f.reconciler->state() == NetworkSwitchState::WAITING_FOR_ADAPTER);
    REQUIRE_FALSE(f.reconciler->adapter_ready());
    REQUIRE(f.switcher->switches.empty());

    f.reconciler->on_adapter_changed(AdapterSnapshot{SEPOLIA, false});
    REQUIRE(f.reconciler->state() == NetworkSwitchState::SWITCHING);
    REQUIRE(f.reconciler->adapter_ready());
    REQUIRE(f.switcher->switches == std::vector<std::string>{SEPOLIA});

    f.switcher->complete();
    REQUIRE(f.reconciler->state() == NetworkSwitchState::IDLE);
    REQUIRE_FALSE(f.reconciler->target_network_id().has_value());
    REQUIRE(f.reconciler->last_synced_network_id() == SEPOLIA);
    REQUIRE(f.observer->events == std::vector<std::string>{
                "network targetSet", "network waitingForAdapter", "network ready", "network switching",
                "network idle"});
}

TEST_CASE("an adapter for another network is not ready", "[network][reconciler]") {
    ReconcilerFixture f;
    f.reconciler->on_adapter_changed(AdapterSnapshot{MAINNET, false});
    f.reconciler->on_selected_network_changed(SEPOLIA);

    REQUIRE(f.reconciler->state() == NetworkSwitchState::WAITING_FOR_ADAPTER);
    REQUIRE(f.switcher->switches.empty());

    f.reconciler->on_adapter_changed(std::nullopt);
    REQUIRE(f.reconciler->state() == NetworkSwitchState::WAITING_FOR_ADAPTER);
}

TEST_CASE("networks without an in-place switch finish immediately", "[network][reconciler]") {
    ReconcilerFixture f;
    f.switcher->in_place = false;

    f.reconciler->on_selected_network_changed(SEPOLIA);
    f.reconciler->on_adapter_changed(AdapterSnapshot{SEPOLIA, false});

    REQUIRE(f.reconciler->state() == NetworkSwitchState::IDLE);
    REQUIRE(f.switcher->switches.empty());
    REQUIRE(f.observer->saw("network ready"));
    REQUIRE_FALSE(f.observer->saw("network switching"));
}

TEST_CASE("repeating the synced selection is ignored", "[network][reconciler]") {
    ReconcilerFixture f;
    f.reconciler->on_selected_network_changed(SEPOLIA);
    f.reconciler->on_selected_network_changed(SEPOLIA);
    REQUIRE(f.wallet->requested.size() == 1);

    SECTION("but the first selection always counts, even when empty") {
        ReconcilerFixture g;
        g.reconciler->on_selected_network_changed(std::nullopt);
        REQUIRE(g.wallet->requested == std::vector<std::optional<std::string> >{std::nullopt});
        REQUIRE(g.reconciler->state() == NetworkSwitchState::IDLE);
    }
}

TEST_CASE("a new selection abandons the switch in flight", "[network][reconciler]") {
    ReconcilerFixture f;
    f.reconciler->on_selected_network_changed(SEPOLIA);
    f.reconciler->on_adapter_changed(AdapterSnapshot{SEPOLIA, false});
    REQUIRE(f.reconciler->state() == NetworkSwitchState::SWITCHING);

    f.reconciler->on_selected_network_changed(MAINNET);
    REQUIRE(f.reconciler->state() == NetworkSwitchState::WAITING_FOR_ADAPTER);

    // The stale completion must not clear the new target
    f.switcher->complete();
    REQUIRE(f.reconciler->state() == NetworkSwitchState::WAITING_FOR_ADAPTER);
    REQUIRE(f.reconciler->target_network_id() == MAINNET);

    f.reconciler->on_adapter_changed(AdapterSnapshot{MAINNET, false});
    REQUIRE(f.switcher->switches == std::vector<std::string>{SEPOLIA, MAINNET});
    f.switcher->complete();
    REQUIRE(f.reconciler->state() == NetworkSwitchState::IDLE);
}

TEST_CASE("a failed switch is reported and not retried", "[network][reconciler]") {
    ReconcilerFixture f;
    f.reconciler->on_selected_network_changed(SEPOLIA);
    f.reconciler->on_adapter_changed(AdapterSnapshot{SEPOLIA, false});
    f.switcher->complete(std::make_exception_ptr(std::runtime_error("User rejected chain switch")));

    REQUIRE(f.reconciler->state() == NetworkSwitchState::IDLE);
    REQUIRE_FALSE(f.reconciler->target_network_id().has_value());
    REQUIRE(f.observer->saw("switch failed ethereum-sepolia User rejected chain switch"));
    REQUIRE(f.switcher->switches.size() == 1);

    SECTION("reconnecting on another chain queues the switch again") {
        f.reconciler->on_wallet_reconnected(MAINNET);
        REQUIRE(f.reconciler->state() == NetworkSwitchState::SWITCHING);
        REQUIRE(f.switcher->switches == std::vector<std::string>{SEPOLIA, SEPOLIA});
    }

    SECTION("reconnecting on the synced chain does nothing") {
        f.reconciler->on_wallet_reconnected(SEPOLIA);
        REQUIRE(f.reconciler->state() == NetworkSwitchState::IDLE);
        REQUIRE(f.switcher->switches.size() == 1);
    }
}

TEST_CASE("reconnecting while a switch is pending does nothing", "[network][reconciler]") {
    ReconcilerFixture f;
    f.reconciler->on_selected_network_changed(SEPOLIA);
    f.reconciler->on_wallet_reconnected(MAINNET);
    REQUIRE(f.reconciler->state() == NetworkSwitchState::WAITING_FOR_ADAPTER);
    REQUIRE(f.switcher->switches.empty());
}

TEST_CASE("a throwing switcher counts as a failed switch", "[network][reconciler]") {
    auto clock = make_clock();
    auto hub = std::make_shared<ObserverHub>(clock);
    auto observer = std::make_shared<RecordingObserver>();
    hub->add_observer(observer);
    auto reconciler = NetworkSwitchReconciler::create(std::make_shared<FakeWalletController>(),
                                                      std::make_shared<ThrowingSwitcher>(), hub);

    reconciler->on_selected_network_changed(SEPOLIA);
    reconciler->on_adapter_changed(AdapterSnapshot{SEPOLIA, false});
    REQUIRE(reconciler->state() == NetworkSwitchState::IDLE);
    REQUIRE(observer->saw("switch failed ethereum-sepolia wallet disconnected"));
}

TEST_CASE("completions after the reconciler is gone are dropped", "[network][reconciler]") {
    ReconcilerFixture f;
    f.reconciler->on_selected_network_changed(SEPOLIA);
    f.reconciler->on_adapter_changed(AdapterSnapshot{SEPOLIA, false});
    f.reconciler.reset();
    REQUIRE_NOTHROW(f.switcher->complete());
}

TEST_CASE("reconciler requires a wallet controller", "[network][reconciler]") {
    REQUIRE_THROWS_AS(NetworkSwitchReconciler::create(nullptr, std::make_shared<FakeNetworkSwitcher>()),
                      std::invalid_argument);
}

#include <txsync/network/network_switch_state.h>

namespace txsync {
    std::string_view to_string(NetworkSwitchState state) noexcept {
        switch (state) {
            case NetworkSwitchState::IDLE: return "idle";
            case NetworkSwitchState::TARGET_SET: return "targetSet";
            case NetworkSwitchState::WAITING_FOR_ADAPTER: return "waitingForAdapter";
            case NetworkSwitchState::READY: return "ready";
            case NetworkSwitchState::SWITCHING: return "switching";
        }
        return "unknown";
    }
} // namespace txsync

#ifndef TXSYNC_NETWORK_SWITCH_STATE_H
#define TXSYNC_NETWORK_SWITCH_STATE_H

#include <txsync/txsync_export.h>

#include <string_view>

namespace txsync {
    enum class NetworkSwitchState {
        IDLE,
        TARGET_SET,
        WAITING_FOR_ADAPTER,
        READY,
        SWITCHING,
    };

    TXSYNC_EXPORT std::string_view to_string(NetworkSwitchState state) noexcept;
} // namespace txsync

#endif  // TXSYNC_NETWORK_SWITCH_STATE_H

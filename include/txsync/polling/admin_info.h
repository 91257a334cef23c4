#ifndef TXSYNC_ADMIN_INFO_H
#define TXSYNC_ADMIN_INFO_H

#include <txsync/polling/refetch_interval.h>

namespace txsync {
    enum class AdminState {
        ACTIVE,
        PENDING,
        EXPIRED,
        RENOUNCED,
    };

    struct PendingAdminTransfer {
        std::string pending_admin;
        // A UNIX timestamp (seconds) when the contract publishes delay info, otherwise a block number
        std::int64_t expiration{0};
    };

    struct PendingAdminDelay {
        std::int64_t new_delay_seconds{0};
        // UNIX timestamp (seconds) when the new delay takes effect
        std::int64_t effect_at{0};
    };

    struct AdminDelayInfo {
        std::int64_t current_delay_seconds{0};
        std::optional<PendingAdminDelay> pending_delay;
    };

    /**
     * The admin query payload of a two-step, delay-protected admin contract.
     */
    struct AdminInfo {
        std::optional<std::string> admin;
        AdminState state{AdminState::ACTIVE};
        std::optional<PendingAdminTransfer> pending_transfer;
        std::optional<AdminDelayInfo> delay_info;
    };

    TXSYNC_EXPORT std::optional<engine_time_t> pending_delay_effect_time(const AdminInfo &info);

    /**
     * Only a contract that reports delay info uses timestamps for transfer expiry; a block-number expiration is
     * not schedulable and yields std::nullopt.
     */
    TXSYNC_EXPORT std::optional<engine_time_t> pending_admin_transfer_effect_time(const AdminInfo &info);

    /**
     * Admin resolver: post-mutation, then a pending delay change, then a timestamp-based pending admin transfer.
     */
    TXSYNC_EXPORT RefetchIntervalResolver<AdminInfo> make_admin_refetch_interval_resolver(
        MutationPollRegistry::s_ptr registry);
} // namespace txsync

#endif  // TXSYNC_ADMIN_INFO_H

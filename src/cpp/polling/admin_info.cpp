#include <txsync/polling/admin_info.h>

namespace txsync {
    std::optional<engine_time_t> pending_delay_effect_time(const AdminInfo &info) {
        if (!info.delay_info || !info.delay_info->pending_delay) { return std::nullopt; }
        auto effect_at = info.delay_info->pending_delay->effect_at;
        if (effect_at == 0) { return std::nullopt; }
        return from_unix_seconds(effect_at);
    }

    std::optional<engine_time_t> pending_admin_transfer_effect_time(const AdminInfo &info) {
        if (info.state != AdminState::PENDING || !info.pending_transfer || !info.delay_info) { return std::nullopt; }
        auto expiration = info.pending_transfer->expiration;
        if (expiration == 0) { return std::nullopt; }
        return from_unix_seconds(expiration);
    }

    RefetchIntervalResolver<AdminInfo> make_admin_refetch_interval_resolver(MutationPollRegistry::s_ptr registry) {
        RefetchIntervalResolver<AdminInfo> resolver(std::move(registry), std::string{query_names::ADMIN});
        resolver.add_countdown_layer("pending_delay", pending_delay_effect_time)
                .add_countdown_layer("pending_admin_transfer", pending_admin_transfer_effect_time);
        return resolver;
    }
} // namespace txsync

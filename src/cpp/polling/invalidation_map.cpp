#include <txsync/polling/invalidation_map.h>

#include <algorithm>
#include <array>

namespace txsync {
    namespace {
        const std::string ROLES{query_names::ROLES};
        const std::string ROLES_ENRICHED{query_names::ROLES_ENRICHED};
        const std::string OWNERSHIP{query_names::OWNERSHIP};
        const std::string ADMIN{query_names::ADMIN};
        const std::string HISTORY{query_names::HISTORY};

        constexpr std::array<std::pair<MutationType, std::string_view>, 11> MUTATION_NAMES{{
            {MutationType::GRANT_ROLE, "grantRole"},
            {MutationType::REVOKE_ROLE, "revokeRole"},
            {MutationType::RENOUNCE_ROLE, "renounceRole"},
            {MutationType::TRANSFER_OWNERSHIP, "transferOwnership"},
            {MutationType::ACCEPT_OWNERSHIP, "acceptOwnership"},
            {MutationType::RENOUNCE_OWNERSHIP, "renounceOwnership"},
            {MutationType::TRANSFER_ADMIN, "transferAdmin"},
            {MutationType::ACCEPT_ADMIN, "acceptAdmin"},
            {MutationType::CANCEL_ADMIN, "cancelAdmin"},
            {MutationType::CHANGE_ADMIN_DELAY, "changeAdminDelay"},
            {MutationType::ROLLBACK_ADMIN_DELAY, "rollbackAdminDelay"},
        }};
    } // namespace

    std::string_view to_string(MutationType type) noexcept {
        for (const auto &[t, name]: MUTATION_NAMES) {
            if (t == type) { return name; }
        }
        return "unknown";
    }

    std::optional<MutationType> parse_mutation_type(std::string_view name) {
        for (const auto &[t, n]: MUTATION_NAMES) {
            if (n == name) { return t; }
        }
        return std::nullopt;
    }

    const InvalidationConfig &invalidation_config(MutationType type) {
        // Every mutation invalidates history; membership changes touch both roles queries
        static const InvalidationConfig role_change{{ROLES, ROLES_ENRICHED, HISTORY}, {}, std::nullopt};
        static const InvalidationConfig transfer_ownership{{OWNERSHIP, HISTORY}, {OWNERSHIP}, std::nullopt};
        static const InvalidationConfig ownership_change{
            {OWNERSHIP, ROLES, ROLES_ENRICHED, HISTORY}, {OWNERSHIP}, std::nullopt
        };
        static const InvalidationConfig transfer_admin{{ADMIN, HISTORY}, {ADMIN}, std::nullopt};
        static const InvalidationConfig accept_admin{{ADMIN, ROLES, ROLES_ENRICHED, HISTORY}, {ADMIN}, std::nullopt};
        static const InvalidationConfig admin_delay{{ADMIN, HISTORY}, {ADMIN}, ADMIN_DEFERRED_REFETCH};

        switch (type) {
            case MutationType::GRANT_ROLE:
            case MutationType::REVOKE_ROLE:
            case MutationType::RENOUNCE_ROLE: return role_change;
            case MutationType::TRANSFER_OWNERSHIP: return transfer_ownership;
            case MutationType::ACCEPT_OWNERSHIP:
            case MutationType::RENOUNCE_OWNERSHIP: return ownership_change;
            case MutationType::TRANSFER_ADMIN: return transfer_admin;
            case MutationType::ACCEPT_ADMIN: return accept_admin;
            case MutationType::CANCEL_ADMIN:
            case MutationType::CHANGE_ADMIN_DELAY:
            case MutationType::ROLLBACK_ADMIN_DELAY: return admin_delay;
        }
        throw_error<std::invalid_argument>("Unknown mutation type {}", static_cast<int>(type));
    }

    InvalidationExecutor::InvalidationExecutor(MutationPollRegistry::s_ptr registry,
                                               QueryInvalidator::s_ptr invalidator)
        : _registry{std::move(registry)}, _invalidator{std::move(invalidator)} {
        if (!_registry) { throw_error<std::invalid_argument>("InvalidationExecutor requires a registry"); }
        if (!_invalidator) { throw_error<std::invalid_argument>("InvalidationExecutor requires a query invalidator"); }
    }

    InvalidationExecutor::~InvalidationExecutor() {
        std::lock_guard<std::mutex> lock(_mutex);
        for (const auto &[key, type]: _deferred) { _registry->clock()->cancel_alarm(_alarm_name(key, type)); }
        _deferred.clear();
    }

    void InvalidationExecutor::execute(MutationType type, const EntityKey &key, MutationPreview::args_t args) {
        const auto &config = invalidation_config(type);
        _registry->record_mutation(key, MutationPreview{std::string{to_string(type)}, std::move(args)});
        _invalidate(type, key, false);
        for (const auto &query: config.await_refetch) { _invalidator->refetch(key, query); }

        if (!config.deferred_refetch) { return; }
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _deferred.emplace(key, type);
        }
        auto &clock = _registry->clock();
        clock->set_alarm_after(*config.deferred_refetch, _alarm_name(key, type),
                               [this, key, type](engine_time_t) {
                                   {
                                       std::lock_guard<std::mutex> lock(_mutex);
                                       if (_deferred.erase({key, type}) == 0) { return; }
                                   }
                                   _invalidate(type, key, true);
                               });
    }

    void InvalidationExecutor::cancel_deferred(const EntityKey &key) {
        std::lock_guard<std::mutex> lock(_mutex);
        for (auto it = _deferred.begin(); it != _deferred.end();) {
            if (it->first == key) {
                _registry->clock()->cancel_alarm(_alarm_name(it->first, it->second));
                it = _deferred.erase(it);
            } else {
                ++it;
            }
        }
    }

    bool InvalidationExecutor::has_deferred(const EntityKey &key) const {
        std::lock_guard<std::mutex> lock(_mutex);
        return std::any_of(_deferred.begin(), _deferred.end(), [&key](const auto &d) { return d.first == key; });
    }

    std::string InvalidationExecutor::_alarm_name(const EntityKey &key, MutationType type) {
        return fmt::format("deferred_refetch:{}:{}", key, to_string(type));
    }

    void InvalidationExecutor::_invalidate(MutationType type, const EntityKey &key, bool deferred) {
        const auto &config = invalidation_config(type);
        if (auto &observers = _registry->observers()) {
            observers->notify_invalidation(key, to_string(type), config.queries, deferred);
        }
        for (const auto &query: config.queries) { _invalidator->invalidate(key, query); }
    }
} // namespace txsync

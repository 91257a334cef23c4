#ifndef TXSYNC_INVALIDATION_MAP_H
#define TXSYNC_INVALIDATION_MAP_H

#include <txsync/polling/mutation_poll_registry.h>

#include <set>
#include <vector>

namespace txsync {
    enum class MutationType {
        GRANT_ROLE,
        REVOKE_ROLE,
        RENOUNCE_ROLE,
        TRANSFER_OWNERSHIP,
        ACCEPT_OWNERSHIP,
        RENOUNCE_OWNERSHIP,
        TRANSFER_ADMIN,
        ACCEPT_ADMIN,
        CANCEL_ADMIN,
        CHANGE_ADMIN_DELAY,
        ROLLBACK_ADMIN_DELAY,
    };

    TXSYNC_EXPORT std::string_view to_string(MutationType type) noexcept;

    TXSYNC_EXPORT std::optional<MutationType> parse_mutation_type(std::string_view name);

    // Extra pass for values the RPC may not expose straight after an admin delay change
    inline constexpr millis_t ADMIN_DEFERRED_REFETCH{3'000};

    struct InvalidationConfig {
        // Everything that might be stale after the mutation
        std::vector<std::string> queries;
        // Queries whose fresh data the host should wait for before treating the mutation as done
        std::vector<std::string> await_refetch;
        std::optional<millis_t> deferred_refetch;
    };

    TXSYNC_EXPORT const InvalidationConfig &invalidation_config(MutationType type);

    /**
     * The host read layer, asked to mark queries stale or to refetch them now.
     */
    struct TXSYNC_EXPORT QueryInvalidator {
        using s_ptr = std::shared_ptr<QueryInvalidator>;

        virtual ~QueryInvalidator() = default;

        virtual void invalidate(const EntityKey &key, std::string_view query) = 0;

        virtual void refetch(const EntityKey &key, std::string_view query) = 0;
    };

    /**
     * Applies the invalidation map after a successful mutation: records the mutation (with a preview built from
     * its type and args), invalidates the affected queries, refetches the awaited ones, and schedules the deferred
     * pass as a clock alarm. Pending deferred passes are cancelled when the executor is destroyed.
     */
    class TXSYNC_EXPORT InvalidationExecutor {
    public:
        InvalidationExecutor(MutationPollRegistry::s_ptr registry, QueryInvalidator::s_ptr invalidator);

        InvalidationExecutor(const InvalidationExecutor &) = delete;

        InvalidationExecutor &operator=(const InvalidationExecutor &) = delete;

        ~InvalidationExecutor();

        void execute(MutationType type, const EntityKey &key, MutationPreview::args_t args = {});

        void cancel_deferred(const EntityKey &key);

        [[nodiscard]] bool has_deferred(const EntityKey &key) const;

    private:
        static std::string _alarm_name(const EntityKey &key, MutationType type);

        void _invalidate(MutationType type, const EntityKey &key, bool deferred);

        MutationPollRegistry::s_ptr _registry;
        QueryInvalidator::s_ptr _invalidator;
        mutable std::mutex _mutex;
        std::set<std::pair<EntityKey, MutationType> > _deferred;
    };
} // namespace txsync

#endif  // TXSYNC_INVALIDATION_MAP_H

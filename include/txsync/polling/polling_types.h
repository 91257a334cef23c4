#ifndef TXSYNC_POLLING_TYPES_H
#define TXSYNC_POLLING_TYPES_H

#include <txsync/txsync_base.h>

#include <map>

namespace txsync {
    /**
     * The unit a mutation and its staleness window are scoped to, conventionally "<ecosystem>:<contract address>".
     */
    using EntityKey = std::string;

    TXSYNC_EXPORT EntityKey make_entity_key(std::string_view ecosystem, std::string_view address);

    /**
     * A reference to the payload the read layer last returned for a query. Only the identity of the pointer is
     * ever inspected, a new reference is taken to mean new data arrived.
     */
    using data_ref_t = std::shared_ptr<const void>;

    /**
     * The next poll delay for a query, std::nullopt meaning "stop polling".
     */
    using poll_interval_t = std::optional<millis_t>;

    /**
     * A lightweight description of the mutation just submitted, so the host can render the expected outcome while
     * the ledger catches up.
     */
    struct MutationPreview {
        using args_t = std::map<std::string, std::string>;

        std::string type;
        args_t args;

        bool operator==(const MutationPreview &other) const = default;
    };

    // Read queries known to the reconciliation engine
    namespace query_names {
        inline constexpr std::string_view ROLES = "roles";
        inline constexpr std::string_view ROLES_ENRICHED = "rolesEnriched";
        inline constexpr std::string_view OWNERSHIP = "ownership";
        inline constexpr std::string_view ADMIN = "admin";
        inline constexpr std::string_view HISTORY = "history";
    } // namespace query_names
} // namespace txsync

#endif  // TXSYNC_POLLING_TYPES_H

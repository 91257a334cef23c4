#include <txsync/polling/polling_types.h>

namespace txsync {
    EntityKey make_entity_key(std::string_view ecosystem, std::string_view address) {
        return fmt::format("{}:{}", ecosystem, address);
    }
} // namespace txsync

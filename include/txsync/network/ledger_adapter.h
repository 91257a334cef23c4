#ifndef TXSYNC_LEDGER_ADAPTER_H
#define TXSYNC_LEDGER_ADAPTER_H

#include <txsync/txsync_base.h>

namespace txsync {
    /**
     * The per-network binding to a ledger, supplied by the host. Only the parts the reconciliation engine reads are
     * exposed here.
     */
    struct TXSYNC_EXPORT LedgerAdapter {
        using ptr = LedgerAdapter *;
        using s_ptr = std::shared_ptr<LedgerAdapter>;
        // Called with the current block (ledger) number, std::nullopt when the read failed
        using block_callback_t = std::function<void(std::optional<std::uint64_t>)>;

        virtual ~LedgerAdapter() = default;

        [[nodiscard]] virtual std::string network_id() const = 0;

        /**
         * Asynchronously read the current block number. The callback may be invoked on any thread, or inline.
         */
        virtual void request_current_block(block_callback_t callback) = 0;
    };
} // namespace txsync

#endif  // TXSYNC_LEDGER_ADAPTER_H

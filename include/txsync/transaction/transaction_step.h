#ifndef TXSYNC_TRANSACTION_STEP_H
#define TXSYNC_TRANSACTION_STEP_H

#include <txsync/txsync_export.h>

#include <string_view>

namespace txsync {
    enum class TransactionStep {
        FORM,
        PENDING,
        CONFIRMING,
        SUCCESS,
        ERROR,
        CANCELLED,
    };

    /**
     * Status reported by the transaction-submission layer while a write is in flight.
     */
    enum class TxStatus {
        IDLE,
        PENDING_SIGNATURE,
        PENDING_CONFIRMATION,
        PENDING_RELAYER,
        SUCCESS,
        ERROR,
    };

    TXSYNC_EXPORT std::string_view to_string(TransactionStep step) noexcept;

    TXSYNC_EXPORT std::string_view to_string(TxStatus status) noexcept;
} // namespace txsync

#endif  // TXSYNC_TRANSACTION_STEP_H

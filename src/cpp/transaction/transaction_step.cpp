#include <txsync/transaction/transaction_step.h>

namespace txsync {
    std::string_view to_string(TransactionStep step) noexcept {
        switch (step) {
            case TransactionStep::FORM: return "form";
            case TransactionStep::PENDING: return "pending";
            case TransactionStep::CONFIRMING: return "confirming";
            case TransactionStep::SUCCESS: return "success";
            case TransactionStep::ERROR: return "error";
            case TransactionStep::CANCELLED: return "cancelled";
        }
        return "unknown";
    }

    std::string_view to_string(TxStatus status) noexcept {
        switch (status) {
            case TxStatus::IDLE: return "idle";
            case TxStatus::PENDING_SIGNATURE: return "pendingSignature";
            case TxStatus::PENDING_CONFIRMATION: return "pendingConfirmation";
            case TxStatus::PENDING_RELAYER: return "pendingRelayer";
            case TxStatus::SUCCESS: return "success";
            case TxStatus::ERROR: return "error";
        }
        return "unknown";
    }
} // namespace txsync

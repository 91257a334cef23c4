/*
 * Expose the transaction and network step enums and the error classification to python
 */
#include <txsync/python/txsync_nanobind.h>
#include <txsync/network/network_switch_state.h>
#include <txsync/transaction/transaction_execution.h>

void export_transaction(nb::module_ &m) {
    using namespace txsync;

    m.attr("SUCCESS_AUTO_CLOSE_DELAY") = SUCCESS_AUTO_CLOSE_DELAY;

    m.def("is_user_rejection_error", &is_user_rejection_error, "message"_a);

    nb::enum_<TransactionStep>(m, "TransactionStep")
        .value("FORM", TransactionStep::FORM)
        .value("PENDING", TransactionStep::PENDING)
        .value("CONFIRMING", TransactionStep::CONFIRMING)
        .value("SUCCESS", TransactionStep::SUCCESS)
        .value("ERROR", TransactionStep::ERROR)
        .value("CANCELLED", TransactionStep::CANCELLED);

    nb::enum_<NetworkSwitchState>(m, "NetworkSwitchState")
        .value("IDLE", NetworkSwitchState::IDLE)
        .value("TARGET_SET", NetworkSwitchState::TARGET_SET)
        .value("WAITING_FOR_ADAPTER", NetworkSwitchState::WAITING_FOR_ADAPTER)
        .value("READY", NetworkSwitchState::READY)
        .value("SWITCHING", NetworkSwitchState::SWITCHING);
}

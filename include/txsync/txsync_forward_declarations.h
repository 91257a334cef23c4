#ifndef TXSYNC_FORWARD_DECLARATIONS_H
#define TXSYNC_FORWARD_DECLARATIONS_H

#include <memory>

namespace txsync {
    // EvaluationClock - shared between every component of a session
    struct EvaluationClock;
    using evaluation_clock_s_ptr = std::shared_ptr<EvaluationClock>;

    struct ReconciliationObserver;
    struct ObserverHub;
    class MutationPollRegistry;
    struct LedgerAdapter;
    class BlockTimeCalibrator;
    class NetworkSwitchReconciler;
} // namespace txsync

#endif  // TXSYNC_FORWARD_DECLARATIONS_H

#include <txsync/polling/refetch_interval.h>

namespace txsync {
    millis_t countdown_poll_interval(engine_time_t effect_at, engine_time_t now) {
        auto remaining = effect_at - now;
        if (remaining <= engine_time_delta_t::zero()) { return COUNTDOWN_OVERDUE_POLL_INTERVAL; }
        if (remaining <= COUNTDOWN_IMMINENT_THRESHOLD) { return COUNTDOWN_IMMINENT_POLL_INTERVAL; }
        return COUNTDOWN_DISTANT_POLL_INTERVAL;
    }
} // namespace txsync

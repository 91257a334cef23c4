#include <txsync/polling/block_poll_interval.h>

#include <algorithm>
#include <cmath>

namespace txsync {
    void BlockPollIntervalConfig::validate() const {
        if (min_interval.count() <= 0 || max_interval.count() <= 0 || default_interval.count() <= 0) {
            throw_error<std::invalid_argument>("Block poll intervals must be positive");
        }
        if (min_interval > max_interval) {
            throw_error<std::invalid_argument>("Block poll min_interval ({}ms) exceeds max_interval ({}ms)",
                                               min_interval.count(), max_interval.count());
        }
        if (default_interval < min_interval || default_interval > max_interval) {
            throw_error<std::invalid_argument>("Block poll default_interval ({}ms) lies outside [{}ms, {}ms]",
                                               default_interval.count(), min_interval.count(),
                                               max_interval.count());
        }
        if (!(multiplier > 0.0)) {
            throw_error<std::invalid_argument>("Block poll multiplier must be positive, got {}", multiplier);
        }
    }

    millis_t compute_block_poll_interval(std::optional<double> avg_block_time_ms,
                                         const BlockPollIntervalConfig &config) {
        if (!avg_block_time_ms || !std::isfinite(*avg_block_time_ms)) { return config.default_interval; }
        // Round half up
        auto scaled = std::floor(*avg_block_time_ms * config.multiplier + 0.5);
        auto lo = static_cast<double>(config.min_interval.count());
        auto hi = static_cast<double>(config.max_interval.count());
        return millis_t{static_cast<millis_t::rep>(std::clamp(scaled, lo, hi))};
    }
} // namespace txsync

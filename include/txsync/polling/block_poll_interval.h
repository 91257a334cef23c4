#ifndef TXSYNC_BLOCK_POLL_INTERVAL_H
#define TXSYNC_BLOCK_POLL_INTERVAL_H

#include <txsync/txsync_base.h>

namespace txsync {
    inline constexpr millis_t DEFAULT_BLOCK_POLL_INTERVAL{10'000};
    inline constexpr millis_t MIN_BLOCK_POLL_INTERVAL{5'000};
    inline constexpr millis_t MAX_BLOCK_POLL_INTERVAL{30'000};
    // Poll slightly slower than one block so each poll is likely to see a new block
    inline constexpr double BLOCK_POLL_MULTIPLIER{1.25};

    struct TXSYNC_EXPORT BlockPollIntervalConfig {
        millis_t default_interval{DEFAULT_BLOCK_POLL_INTERVAL};
        millis_t min_interval{MIN_BLOCK_POLL_INTERVAL};
        millis_t max_interval{MAX_BLOCK_POLL_INTERVAL};
        double multiplier{BLOCK_POLL_MULTIPLIER};

        /**
         * Throws std::invalid_argument when an interval is non-positive, min exceeds max, the default lies
         * outside [min, max] or the multiplier is non-positive.
         */
        void validate() const;
    };

    /**
     * The chain-agnostic "roughly once per block" cadence: the default interval while the block time is unknown,
     * otherwise avg * multiplier rounded to the nearest millisecond and clamped to [min, max].
     */
    TXSYNC_EXPORT millis_t compute_block_poll_interval(std::optional<double> avg_block_time_ms,
                                                       const BlockPollIntervalConfig &config = {});
} // namespace txsync

#endif  // TXSYNC_BLOCK_POLL_INTERVAL_H

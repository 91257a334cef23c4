#ifndef TXSYNC_BLOCK_TIME_H
#define TXSYNC_BLOCK_TIME_H

#include <txsync/network/ledger_adapter.h>
#include <txsync/polling/block_poll_interval.h>
#include <txsync/runtime/evaluation_clock.h>
#include <txsync/runtime/observers/reconciliation_observer.h>
#include <txsync/util/lifecycle.h>

#include <deque>
#include <mutex>

namespace txsync {
    inline constexpr millis_t BLOCK_TIME_POLL_INTERVAL{10'000};
    inline constexpr std::size_t BLOCK_TIME_MIN_SAMPLES{3};
    inline constexpr std::size_t BLOCK_TIME_MAX_SAMPLES{20};
    inline constexpr std::size_t LOW_CONFIDENCE_THRESHOLD{5};
    inline constexpr std::size_t MEDIUM_CONFIDENCE_THRESHOLD{10};

    struct TXSYNC_EXPORT BlockTimeConfig {
        millis_t poll_interval{BLOCK_TIME_POLL_INTERVAL};
        std::size_t min_samples{BLOCK_TIME_MIN_SAMPLES};
        std::size_t max_samples{BLOCK_TIME_MAX_SAMPLES};

        void validate() const;
    };

    enum class EstimateConfidence {
        LOW,
        MEDIUM,
        HIGH,
    };

    TXSYNC_EXPORT std::string_view to_string(EstimateConfidence confidence) noexcept;

    struct BlockSample {
        std::uint64_t block;
        engine_time_t timestamp;
    };

    struct BlockTimeEstimate {
        std::optional<double> avg_block_time_ms;
        std::size_t sample_count{0};
        bool is_calibrating{true};
        EstimateConfidence confidence{EstimateConfidence::LOW};
    };

    struct BlockExpirationEstimate {
        std::uint64_t blocks_remaining;
        std::optional<std::string> time_estimate;
    };

    /**
     * Sliding window of block observations and the average block time derived from them.
     */
    class TXSYNC_EXPORT BlockTimeEstimator {
    public:
        explicit BlockTimeEstimator(BlockTimeConfig config = {});

        /**
         * Appends a sample, dropping the oldest once the window holds more than max_samples.
         */
        void add_sample(std::uint64_t block_number, engine_time_t timestamp);

        [[nodiscard]] BlockTimeEstimate estimate() const;

        /**
         * blocks * average block time, std::nullopt while calibrating or when blocks is not positive.
         */
        [[nodiscard]] std::optional<millis_t> estimated_duration(std::int64_t blocks) const;

        [[nodiscard]] std::optional<std::string> format_blocks_to_time(std::int64_t blocks) const;

        [[nodiscard]] bool is_fully_calibrated() const;

        [[nodiscard]] std::size_t sample_count() const;

        [[nodiscard]] const BlockTimeConfig &config() const { return _config; }

        void clear();

    private:
        [[nodiscard]] std::optional<double> _average() const;

        BlockTimeConfig _config;
        mutable std::mutex _mutex;
        std::deque<BlockSample> _samples;
    };

    /**
     * Human-readable approximation of a duration: "~2d 3h", "~3 days", "~1h 5m", "~2 hours", "~15 minutes",
     * "< 1 minute".
     */
    TXSYNC_EXPORT std::string format_duration_estimate(millis_t duration);

    /**
     * Blocks remaining until expiration_block and their time estimate, std::nullopt when the current block is
     * unknown or the expiration has already been reached.
     */
    TXSYNC_EXPORT std::optional<BlockExpirationEstimate> calculate_block_expiration(
        std::uint64_t expiration_block, std::optional<std::uint64_t> current_block,
        const BlockTimeEstimator &estimator);

    /**
     * Calibrates the estimator by polling the adapter's current block on the clock. Samples are only taken when
     * the block changes, the first observation primes the comparison. Polling stops once the estimator holds
     * max_samples, and on stop(). A change to an adapter bound to a different network discards the samples.
     *
     * Must be owned by a std::shared_ptr, adapter callbacks hold a weak reference.
     */
    class TXSYNC_EXPORT BlockTimeCalibrator : public ComponentLifeCycle,
                                              public std::enable_shared_from_this<BlockTimeCalibrator> {
    public:
        using s_ptr = std::shared_ptr<BlockTimeCalibrator>;

        static s_ptr create(EvaluationClock::s_ptr clock, BlockTimeConfig config = {},
                            ObserverHub::s_ptr observers = {});

        ~BlockTimeCalibrator() override;

        void set_adapter(LedgerAdapter::s_ptr adapter);

        [[nodiscard]] const LedgerAdapter::s_ptr &adapter() const { return _adapter; }

        [[nodiscard]] BlockTimeEstimate estimate() const { return _estimator.estimate(); }

        [[nodiscard]] const BlockTimeEstimator &estimator() const { return _estimator; }

        [[nodiscard]] bool is_polling() const;

        [[nodiscard]] std::optional<std::uint64_t> last_block() const;

    protected:
        BlockTimeCalibrator(EvaluationClock::s_ptr clock, BlockTimeConfig config, ObserverHub::s_ptr observers);

        void initialise() override;

        void start() override;

        void stop() override;

        void dispose() override;

    private:
        void _poll();

        void _on_block(std::uint64_t generation, std::optional<std::uint64_t> block);

        void _schedule_next_poll();

        void _stop_polling();

        [[nodiscard]] std::string _network_id() const;

        EvaluationClock::s_ptr _clock;
        BlockTimeEstimator _estimator;
        ObserverHub::s_ptr _observers;
        LedgerAdapter::s_ptr _adapter;
        std::string _alarm_name;

        mutable std::mutex _mutex;
        std::optional<std::uint64_t> _last_block;
        // Bumped on stop and adapter change so late block reads are dropped
        std::uint64_t _generation{0};
        bool _running{false};
        bool _polling{false};
    };

    /**
     * The session-wide block-time estimate. Calibration runs while an adapter is set (a contract is selected) and
     * is stopped when the adapter is cleared.
     */
    class TXSYNC_EXPORT BlockTimeService {
    public:
        BlockTimeService(EvaluationClock::s_ptr clock, BlockTimeConfig config = {},
                         BlockPollIntervalConfig poll_config = {}, ObserverHub::s_ptr observers = {});

        BlockTimeService(const BlockTimeService &) = delete;

        BlockTimeService &operator=(const BlockTimeService &) = delete;

        ~BlockTimeService();

        void set_adapter(LedgerAdapter::s_ptr adapter);

        [[nodiscard]] BlockTimeEstimate estimate() const;

        /**
         * compute_block_poll_interval applied to the current estimate.
         */
        [[nodiscard]] millis_t block_poll_interval() const;

        [[nodiscard]] std::optional<std::string> format_blocks_to_time(std::int64_t blocks) const;

        [[nodiscard]] std::optional<BlockExpirationEstimate> block_expiration(
            std::uint64_t expiration_block, std::optional<std::uint64_t> current_block) const;

        [[nodiscard]] const BlockTimeCalibrator &calibrator() const { return *_calibrator; }

    private:
        BlockPollIntervalConfig _poll_config;
        BlockTimeCalibrator::s_ptr _calibrator;
    };
} // namespace txsync

#endif  // TXSYNC_BLOCK_TIME_H

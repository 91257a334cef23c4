#include <txsync/polling/block_time.h>

#include <cstdio>

namespace txsync {
    void BlockTimeConfig::validate() const {
        if (poll_interval.count() <= 0) {
            throw_error<std::invalid_argument>("Block time poll_interval must be positive, got {}ms",
                                               poll_interval.count());
        }
        if (min_samples < 2) {
            throw_error<std::invalid_argument>("Block time min_samples must be at least 2, got {}", min_samples);
        }
        if (min_samples > max_samples) {
            throw_error<std::invalid_argument>("Block time min_samples ({}) exceeds max_samples ({})", min_samples,
                                               max_samples);
        }
    }

    std::string_view to_string(EstimateConfidence confidence) noexcept {
        switch (confidence) {
            case EstimateConfidence::LOW: return "low";
            case EstimateConfidence::MEDIUM: return "medium";
            case EstimateConfidence::HIGH: return "high";
        }
        return "unknown";
    }

    BlockTimeEstimator::BlockTimeEstimator(BlockTimeConfig config) : _config{config} { _config.validate(); }

    void BlockTimeEstimator::add_sample(std::uint64_t block_number, engine_time_t timestamp) {
        std::lock_guard<std::mutex> lock(_mutex);
        _samples.push_back({block_number, timestamp});
        while (_samples.size() > _config.max_samples) { _samples.pop_front(); }
    }

    std::optional<double> BlockTimeEstimator::_average() const {
        if (_samples.size() < _config.min_samples) { return std::nullopt; }
        double elapsed_ms{0.0};
        double elapsed_blocks{0.0};
        for (std::size_t i = 1; i < _samples.size(); ++i) {
            const auto &prev = _samples[i - 1];
            const auto &next = _samples[i];
            elapsed_ms += std::chrono::duration<double, std::milli>(next.timestamp - prev.timestamp).count();
            elapsed_blocks += static_cast<double>(next.block) - static_cast<double>(prev.block);
        }
        if (elapsed_ms <= 0.0 || elapsed_blocks <= 0.0) { return std::nullopt; }
        return elapsed_ms / elapsed_blocks;
    }

    BlockTimeEstimate BlockTimeEstimator::estimate() const {
        std::lock_guard<std::mutex> lock(_mutex);
        auto count = _samples.size();
        auto confidence = count < LOW_CONFIDENCE_THRESHOLD
                              ? EstimateConfidence::LOW
                              : (count < MEDIUM_CONFIDENCE_THRESHOLD ? EstimateConfidence::MEDIUM
                                                                     : EstimateConfidence::HIGH);
        return {_average(), count, count < _config.min_samples, confidence};
    }

    std::optional<millis_t> BlockTimeEstimator::estimated_duration(std::int64_t blocks) const {
        if (blocks <= 0) { return std::nullopt; }
        std::lock_guard<std::mutex> lock(_mutex);
        auto avg = _average();
        if (!avg) { return std::nullopt; }
        return millis_t{static_cast<millis_t::rep>(static_cast<double>(blocks) * *avg)};
    }

    std::optional<std::string> BlockTimeEstimator::format_blocks_to_time(std::int64_t blocks) const {
        auto duration = estimated_duration(blocks);
        if (!duration) { return std::nullopt; }
        return format_duration_estimate(*duration);
    }

    bool BlockTimeEstimator::is_fully_calibrated() const { return sample_count() >= _config.max_samples; }

    std::size_t BlockTimeEstimator::sample_count() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _samples.size();
    }

    void BlockTimeEstimator::clear() {
        std::lock_guard<std::mutex> lock(_mutex);
        _samples.clear();
    }

    std::string format_duration_estimate(millis_t duration) {
        auto seconds = duration.count() / 1000;
        auto minutes = seconds / 60;
        auto hours = minutes / 60;
        auto days = hours / 24;

        if (days > 0) {
            auto remaining_hours = hours % 24;
            if (remaining_hours > 0 && days < 7) { return fmt::format("~{}d {}h", days, remaining_hours); }
            return fmt::format("~{} day{}", days, days > 1 ? "s" : "");
        }
        if (hours > 0) {
            auto remaining_minutes = minutes % 60;
            if (remaining_minutes > 0) { return fmt::format("~{}h {}m", hours, remaining_minutes); }
            return fmt::format("~{} hour{}", hours, hours > 1 ? "s" : "");
        }
        if (minutes > 0) { return fmt::format("~{} minute{}", minutes, minutes > 1 ? "s" : ""); }
        return "< 1 minute";
    }

    std::optional<BlockExpirationEstimate> calculate_block_expiration(std::uint64_t expiration_block,
                                                                      std::optional<std::uint64_t> current_block,
                                                                      const BlockTimeEstimator &estimator) {
        if (!current_block || *current_block >= expiration_block) { return std::nullopt; }
        auto remaining = expiration_block - *current_block;
        return BlockExpirationEstimate{remaining, estimator.format_blocks_to_time(static_cast<std::int64_t>(remaining))};
    }

    BlockTimeCalibrator::s_ptr BlockTimeCalibrator::create(EvaluationClock::s_ptr clock, BlockTimeConfig config,
                                                           ObserverHub::s_ptr observers) {
        return s_ptr(new BlockTimeCalibrator(std::move(clock), config, std::move(observers)));
    }

    BlockTimeCalibrator::BlockTimeCalibrator(EvaluationClock::s_ptr clock, BlockTimeConfig config,
                                             ObserverHub::s_ptr observers)
        : _clock{std::move(clock)}, _estimator{config}, _observers{std::move(observers)},
          _alarm_name{fmt::format("block_time_calibrator@{}", fmt::ptr(this))} {
        if (!_clock) { throw_error<std::invalid_argument>("BlockTimeCalibrator requires a clock"); }
    }

    BlockTimeCalibrator::~BlockTimeCalibrator() { _clock->cancel_alarm(_alarm_name); }

    void BlockTimeCalibrator::set_adapter(LedgerAdapter::s_ptr adapter) {
        bool network_changed;
        bool running;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            network_changed = adapter && (!_adapter || _adapter->network_id() != adapter->network_id());
            _adapter = std::move(adapter);
            _last_block.reset();
            ++_generation;
            running = _running;
        }
        if (network_changed) { _estimator.clear(); }
        if (running) {
            _clock->cancel_alarm(_alarm_name);
            _poll();
        }
    }

    bool BlockTimeCalibrator::is_polling() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _polling;
    }

    std::optional<std::uint64_t> BlockTimeCalibrator::last_block() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _last_block;
    }

    void BlockTimeCalibrator::initialise() {
    }

    void BlockTimeCalibrator::start() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _running = true;
        }
        _poll();
    }

    void BlockTimeCalibrator::stop() {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _running = false;
            ++_generation;
        }
        _stop_polling();
    }

    void BlockTimeCalibrator::dispose() {
        std::lock_guard<std::mutex> lock(_mutex);
        _adapter.reset();
        _last_block.reset();
    }

    void BlockTimeCalibrator::_poll() {
        LedgerAdapter::s_ptr adapter;
        std::uint64_t generation;
        bool started_polling;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (!_running || !_adapter) { return; }
            adapter = _adapter;
            generation = _generation;
            started_polling = !_polling;
        }
        if (_estimator.is_fully_calibrated()) {
            _stop_polling();
            return;
        }
        {
            std::lock_guard<std::mutex> lock(_mutex);
            _polling = true;
        }
        if (started_polling && _observers) { _observers->notify_calibration_state(adapter->network_id(), true); }

        // Scheduled before the read so an inline completion that finishes calibration can cancel it
        _schedule_next_poll();
        std::weak_ptr<BlockTimeCalibrator> weak = weak_from_this();
        adapter->request_current_block([weak, generation](std::optional<std::uint64_t> block) {
            if (auto self = weak.lock()) { self->_on_block(generation, block); }
        });
    }

    void BlockTimeCalibrator::_on_block(std::uint64_t generation, std::optional<std::uint64_t> block) {
        if (!block) { return; }
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (generation != _generation) { return; }
            auto previous = _last_block;
            _last_block = block;
            if (!previous || *previous == *block) { return; }
        }

        _estimator.add_sample(*block, _clock->now());
        if (_observers) {
            auto estimate = _estimator.estimate();
            _observers->notify_block_sample(_network_id(), *block, estimate.sample_count, estimate.avg_block_time_ms);
        }
        if (_estimator.is_fully_calibrated()) { _stop_polling(); }
    }

    void BlockTimeCalibrator::_schedule_next_poll() {
        std::weak_ptr<BlockTimeCalibrator> weak = weak_from_this();
        _clock->set_alarm_after(_estimator.config().poll_interval, _alarm_name, [weak](engine_time_t) {
            if (auto self = weak.lock()) { self->_poll(); }
        });
    }

    void BlockTimeCalibrator::_stop_polling() {
        _clock->cancel_alarm(_alarm_name);
        bool was_polling;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            was_polling = _polling;
            _polling = false;
        }
        if (was_polling && _observers) { _observers->notify_calibration_state(_network_id(), false); }
    }

    std::string BlockTimeCalibrator::_network_id() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _adapter ? _adapter->network_id() : std::string{};
    }

    BlockTimeService::BlockTimeService(EvaluationClock::s_ptr clock, BlockTimeConfig config,
                                       BlockPollIntervalConfig poll_config, ObserverHub::s_ptr observers)
        : _poll_config{poll_config},
          _calibrator{BlockTimeCalibrator::create(std::move(clock), config, std::move(observers))} {
        _poll_config.validate();
    }

    BlockTimeService::~BlockTimeService() {
        try {
            dispose_component(*_calibrator);
        } catch (const std::exception &e) {
            fprintf(stderr, "Warning: exception disposing block time calibrator: %s\n", e.what());
        }
    }

    void BlockTimeService::set_adapter(LedgerAdapter::s_ptr adapter) {
        if (adapter) {
            _calibrator->set_adapter(std::move(adapter));
            start_component(*_calibrator);
        } else {
            stop_component(*_calibrator);
            _calibrator->set_adapter(nullptr);
        }
    }

    BlockTimeEstimate BlockTimeService::estimate() const { return _calibrator->estimate(); }

    millis_t BlockTimeService::block_poll_interval() const {
        return compute_block_poll_interval(estimate().avg_block_time_ms, _poll_config);
    }

    std::optional<std::string> BlockTimeService::format_blocks_to_time(std::int64_t blocks) const {
        return _calibrator->estimator().format_blocks_to_time(blocks);
    }

    std::optional<BlockExpirationEstimate> BlockTimeService::block_expiration(
        std::uint64_t expiration_block, std::optional<std::uint64_t> current_block) const {
        return calculate_block_expiration(expiration_block, current_block, _calibrator->estimator());
    }
} // namespace txsync

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include <txsync/polling/block_time.h>

#include "../test_support.h"

using namespace txsync;
using namespace txsync::testing;
using namespace std::chrono_literals;
using Catch::Matchers::WithinAbs;

namespace {
    void add_blocks(BlockTimeEstimator &estimator, std::size_t count, std::uint64_t first_block = 100,
                    engine_time_delta_t block_time = 12s) {
        for (std::size_t i = 0; i < count; ++i) {
            estimator.add_sample(first_block + i, start_time() + block_time * static_cast<int>(i));
        }
    }
} // namespace

// ============================================================================
// BlockTimeEstimator
// ============================================================================

TEST_CASE("estimator is calibrating below min_samples", "[polling][block_time]") {
    BlockTimeEstimator estimator;
    add_blocks(estimator, 2);

    auto estimate = estimator.estimate();
    REQUIRE_FALSE(estimate.avg_block_time_ms.has_value());
    REQUIRE(estimate.is_calibrating);
    REQUIRE(estimate.sample_count == 2);
    REQUIRE_FALSE(estimator.format_blocks_to_time(10).has_value());
}

TEST_CASE("estimator averages consecutive deltas", "[polling][block_time]") {
    BlockTimeEstimator estimator;
    add_blocks(estimator, 3);

    auto estimate = estimator.estimate();
    REQUIRE(estimate.avg_block_time_ms.has_value());
    REQUIRE_THAT(*estimate.avg_block_time_ms, WithinAbs(12000.0, 1e-6));
    REQUIRE_FALSE(estimate.is_calibrating);
    REQUIRE(estimate.confidence == EstimateConfidence::LOW);

    SECTION("skipped blocks are spread over the elapsed time") {
        estimator.add_sample(105, start_time() + 84s);
        REQUIRE_THAT(*estimator.estimate().avg_block_time_ms, WithinAbs(84000.0 / 5.0, 1e-6));
    }
}

TEST_CASE("estimator keeps at most max_samples", "[polling][block_time]") {
    BlockTimeEstimator estimator(BlockTimeConfig{10s, 3, 5});
    add_blocks(estimator, 4, 100, 12s);
    // Slower blocks push the fast ones out of the window
    for (std::uint64_t i = 0; i < 5; ++i) { estimator.add_sample(200 + i, start_time() + 1h + 2s * static_cast<int>(i)); }

    REQUIRE(estimator.sample_count() == 5);
    REQUIRE(estimator.is_fully_calibrated());
    REQUIRE_THAT(*estimator.estimate().avg_block_time_ms, WithinAbs(2000.0, 1e-6));
}

TEST_CASE("estimator confidence grows with samples", "[polling][block_time]") {
    BlockTimeEstimator estimator;
    add_blocks(estimator, 5);
    REQUIRE(estimator.estimate().confidence == EstimateConfidence::MEDIUM);
    estimator.clear();
    add_blocks(estimator, 10);
    REQUIRE(estimator.estimate().confidence == EstimateConfidence::HIGH);
}

TEST_CASE("estimator rejects non-advancing samples", "[polling][block_time]") {
    BlockTimeEstimator estimator;
    estimator.add_sample(100, start_time());
    estimator.add_sample(100, start_time() + 12s);
    estimator.add_sample(100, start_time() + 24s);
    REQUIRE_FALSE(estimator.estimate().avg_block_time_ms.has_value());
}

TEST_CASE("estimated durations and formatting", "[polling][block_time]") {
    BlockTimeEstimator estimator;
    add_blocks(estimator, 3);  // 12s blocks

    REQUIRE(estimator.estimated_duration(10) == 120000ms);
    REQUIRE_FALSE(estimator.estimated_duration(0).has_value());
    REQUIRE_FALSE(estimator.estimated_duration(-5).has_value());
    REQUIRE(estimator.format_blocks_to_time(300) == "~1 hour");
    REQUIRE(estimator.format_blocks_to_time(325) == "~1h 5m");
}

TEST_CASE("format_duration_estimate", "[polling][block_time]") {
    REQUIRE(format_duration_estimate(30s) == "< 1 minute");
    REQUIRE(format_duration_estimate(60s) == "~1 minute");
    REQUIRE(format_duration_estimate(15min) == "~15 minutes");
    REQUIRE(format_duration_estimate(2h) == "~2 hours");
    REQUIRE(format_duration_estimate(2h + 5min) == "~2h 5m");
    REQUIRE(format_duration_estimate(24h) == "~1 day");
    REQUIRE(format_duration_estimate(27h) == "~1d 3h");
    REQUIRE(format_duration_estimate(3 * 24h) == "~3 days");
    // A week or more drops the hours
    REQUIRE(format_duration_estimate(8 * 24h + 5h) == "~8 days");
}

TEST_CASE("calculate_block_expiration", "[polling][block_time]") {
    BlockTimeEstimator estimator;
    add_blocks(estimator, 3);

    REQUIRE_FALSE(calculate_block_expiration(2000, std::nullopt, estimator).has_value());
    REQUIRE_FALSE(calculate_block_expiration(2000, 2000, estimator).has_value());
    REQUIRE_FALSE(calculate_block_expiration(2000, 2500, estimator).has_value());

    auto estimate = calculate_block_expiration(2075, 2000, estimator);
    REQUIRE(estimate.has_value());
    REQUIRE(estimate->blocks_remaining == 75);
    REQUIRE(estimate->time_estimate == "~15 minutes");

    BlockTimeEstimator calibrating;
    REQUIRE_FALSE(calculate_block_expiration(2075, 2000, calibrating)->time_estimate.has_value());
}

TEST_CASE("block time config validation", "[polling][block_time][config]") {
    REQUIRE_THROWS_AS(BlockTimeEstimator(BlockTimeConfig{10s, 6, 5}), std::invalid_argument);
    REQUIRE_THROWS_AS(BlockTimeEstimator(BlockTimeConfig{0s, 3, 20}), std::invalid_argument);
}

// ============================================================================
// BlockTimeCalibrator
// ============================================================================

TEST_CASE("calibrator samples only when the block changes", "[polling][block_time][calibrator]") {
    auto clock = make_clock();
    auto calibrator = BlockTimeCalibrator::create(clock);
    auto adapter = std::make_shared<FakeLedgerAdapter>("ethereum-mainnet", 1000);
    calibrator->set_adapter(adapter);

    StartStopContext running(*calibrator);
    REQUIRE(calibrator->is_polling());
    REQUIRE(adapter->requests == 1);
    REQUIRE(calibrator->last_block() == 1000u);
    REQUIRE(calibrator->estimator().sample_count() == 0);  // first read only primes

    clock->advance(10s);  // same block
    REQUIRE(adapter->requests == 2);
    REQUIRE(calibrator->estimator().sample_count() == 0);

    for (int i = 0; i < 3; ++i) {
        adapter->current_block += 1;
        clock->advance(10s);
    }
    REQUIRE(calibrator->estimator().sample_count() == 3);
    REQUIRE_THAT(*calibrator->estimate().avg_block_time_ms, WithinAbs(10000.0, 1e-6));
}

TEST_CASE("calibrator stops polling once fully calibrated", "[polling][block_time][calibrator]") {
    auto clock = make_clock();
    auto hub = std::make_shared<ObserverHub>(clock);
    auto observer = std::make_shared<RecordingObserver>();
    hub->add_observer(observer);
    auto calibrator = BlockTimeCalibrator::create(clock, BlockTimeConfig{5s, 3, 4}, hub);
    auto adapter = std::make_shared<FakeLedgerAdapter>("stellar-testnet", 50);
    calibrator->set_adapter(adapter);
    StartStopContext running(*calibrator);

    for (int i = 0; i < 4; ++i) {
        adapter->current_block += 1;
        clock->advance(5s);
    }
    REQUIRE(calibrator->estimator().is_fully_calibrated());
    REQUIRE_FALSE(calibrator->is_polling());
    REQUIRE_FALSE(clock->has_alarm(fmt::format("block_time_calibrator@{}", fmt::ptr(calibrator.get()))));

    auto requests = adapter->requests;
    clock->advance(1min);
    REQUIRE(adapter->requests == requests);
    REQUIRE(observer->saw("calibration started"));
    REQUIRE(observer->saw("calibration stopped"));
    REQUIRE(observer->saw("block 54"));
}

TEST_CASE("calibrator releases its polling source on stop", "[polling][block_time][calibrator]") {
    auto clock = make_clock();
    auto calibrator = BlockTimeCalibrator::create(clock);
    auto adapter = std::make_shared<FakeLedgerAdapter>("ethereum-mainnet");
    calibrator->set_adapter(adapter);

    start_component(*calibrator);
    stop_component(*calibrator);
    REQUIRE_FALSE(calibrator->is_polling());
    REQUIRE(clock->alarm_count() == 0);

    clock->advance(1min);
    REQUIRE(adapter->requests == 1);

    // and can start again cleanly
    start_component(*calibrator);
    REQUIRE(calibrator->is_polling());
    REQUIRE(adapter->requests == 2);
    stop_component(*calibrator);
}

TEST_CASE("calibrator without an adapter does not poll", "[polling][block_time][calibrator]") {
    auto clock = make_clock();
    auto calibrator = BlockTimeCalibrator::create(clock);
    StartStopContext running(*calibrator);
    REQUIRE_FALSE(calibrator->is_polling());
    REQUIRE(clock->alarm_count() == 0);
}

TEST_CASE("switching to another network discards samples", "[polling][block_time][calibrator]") {
    auto clock = make_clock();
    auto calibrator = BlockTimeCalibrator::create(clock);
    auto mainnet = std::make_shared<FakeLedgerAdapter>("ethereum-mainnet", 10);
    calibrator->set_adapter(mainnet);
    StartStopContext running(*calibrator);
    for (int i = 0; i < 3; ++i) {
        mainnet->current_block += 1;
        clock->advance(10s);
    }
    REQUIRE(calibrator->estimator().sample_count() == 3);

    SECTION("same network keeps the estimate") {
        calibrator->set_adapter(std::make_shared<FakeLedgerAdapter>("ethereum-mainnet", 20));
        REQUIRE(calibrator->estimator().sample_count() == 3);
    }

    SECTION("different network starts over") {
        auto other = std::make_shared<FakeLedgerAdapter>("polygon", 500);
        calibrator->set_adapter(other);
        REQUIRE(calibrator->estimator().sample_count() == 0);
        REQUIRE(calibrator->last_block() == 500u);
        REQUIRE(other->requests == 1);
    }
}

TEST_CASE("failed block reads are skipped", "[polling][block_time][calibrator]") {
    auto clock = make_clock();
    auto calibrator = BlockTimeCalibrator::create(clock);
    auto adapter = std::make_shared<FakeLedgerAdapter>("ethereum-mainnet", 10);
    adapter->fail_reads = true;
    calibrator->set_adapter(adapter);
    StartStopContext running(*calibrator);

    clock->advance(10s);
    REQUIRE_FALSE(calibrator->last_block().has_value());
    REQUIRE(calibrator->is_polling());

    adapter->fail_reads = false;
    clock->advance(10s);
    REQUIRE(calibrator->last_block() == 10u);
}

// ============================================================================
// BlockTimeService
// ============================================================================

TEST_CASE("block time service follows adapter selection", "[polling][block_time][service]") {
    auto clock = make_clock();
    BlockTimeService service(clock);
    auto adapter = std::make_shared<FakeLedgerAdapter>("ethereum-mainnet", 100);

    REQUIRE(service.block_poll_interval() == DEFAULT_BLOCK_POLL_INTERVAL);

    service.set_adapter(adapter);
    REQUIRE(service.calibrator().is_started());
    for (int i = 0; i < 3; ++i) {
        adapter->current_block += 1;
        clock->advance(10s);
    }
    REQUIRE(service.block_poll_interval() == 12500ms);
    REQUIRE(service.format_blocks_to_time(6) == "~1 minute");
    REQUIRE(service.block_expiration(112, 100)->blocks_remaining == 12);

    service.set_adapter(nullptr);
    REQUIRE_FALSE(service.calibrator().is_started());
    REQUIRE(clock->alarm_count() == 0);
    // The estimate outlives the selection
    REQUIRE(service.estimate().sample_count == 3);
}

#include <catch2/catch_test_macros.hpp>

#include <txsync/transaction/transaction_execution.h>

#include "../test_support.h"

using namespace txsync;
using namespace txsync::testing;
using namespace std::chrono_literals;

namespace {
    struct GrantArgs {
        std::string role;
        std::string account;
    };

    using GrantHandle = FakeMutationHandle<GrantArgs>;

    struct ThrowingHandle : MutationHandle<GrantArgs> {
        void mutate_async(const GrantArgs &, mutation_completion_t) override {
            throw std::runtime_error("Adapter not connected");
        }

        void reset() override {
        }

        [[nodiscard]] TxStatus status() const override { return TxStatus::IDLE; }

        [[nodiscard]] bool is_pending() const override { return false; }
    };

    struct ExecutionFixture {
        SimulationEvaluationClock::s_ptr clock{make_clock()};
        ObserverHub::s_ptr hub{std::make_shared<ObserverHub>(clock)};
        std::shared_ptr<RecordingObserver> observer{std::make_shared<RecordingObserver>()};
        std::shared_ptr<GrantHandle> handle{std::make_shared<GrantHandle>()};
        std::size_t closed{0};
        std::vector<std::string> succeeded;

        ExecutionFixture() { hub->add_observer(observer); }

        TransactionExecution<GrantArgs>::s_ptr make_execution() {
            TransactionExecutionOptions options;
            options.on_close = [this] { ++closed; };
            options.on_success = [this](const OperationResult &result) { succeeded.push_back(result.id); };
            options.label = "grant";
            return TransactionExecution<GrantArgs>::create(handle, clock, std::move(options), hub);
        }
    };

    const GrantArgs MINTER{"MINTER", "0xdef"};
} // namespace

// ============================================================================
// Rejection classification
// ============================================================================

TEST_CASE("is_user_rejection_error", "[transaction]") {
    REQUIRE(is_user_rejection_error("User rejected the transaction"));
    REQUIRE(is_user_rejection_error("Request CANCELLED by user"));
    REQUIRE(is_user_rejection_error("Signature denied"));
    REQUIRE(is_user_rejection_error("User refused to sign"));
    REQUIRE_FALSE(is_user_rejection_error("RPC timeout"));
    REQUIRE_FALSE(is_user_rejection_error("insufficient funds for gas"));
    REQUIRE_FALSE(is_user_rejection_error(""));
}

// ============================================================================
// TransactionExecution
// ============================================================================

TEST_CASE("a user rejection is a quiet cancellation", "[transaction][execution]") {
    ExecutionFixture f;
    auto execution = f.make_execution();

    execution->execute(MINTER);
    REQUIRE(execution->step() == TransactionStep::PENDING);
    REQUIRE(execution->is_transacting());

    f.handle->fail("User rejected the transaction");
    REQUIRE(execution->step() == TransactionStep::CANCELLED);
    REQUIRE_FALSE(execution->error_message().has_value());
    REQUIRE_FALSE(execution->is_transacting());
}

TEST_CASE("other failures surface their message", "[transaction][execution]") {
    ExecutionFixture f;
    auto execution = f.make_execution();

    execution->execute(MINTER);
    f.handle->fail("RPC timeout");
    REQUIRE(execution->step() == TransactionStep::ERROR);
    REQUIRE(execution->error_message() == "RPC timeout");
    REQUIRE(f.observer->saw("grant pending->error"));
}

TEST_CASE("success closes after the auto-close delay", "[transaction][execution]") {
    ExecutionFixture f;
    auto execution = f.make_execution();

    execution->execute(MINTER);
    f.handle->succeed("0x42");

    REQUIRE(execution->step() == TransactionStep::SUCCESS);
    REQUIRE(f.succeeded == std::vector<std::string>{"0x42"});
    REQUIRE(execution->has_pending_close());
    REQUIRE(f.closed == 0);

    f.clock->advance(1499ms);
    REQUIRE(f.closed == 0);
    f.clock->advance(1ms);
    REQUIRE(f.closed == 1);
    REQUIRE_FALSE(execution->has_pending_close());
    REQUIRE(f.observer->events == std::vector<std::string>{"grant form->pending", "grant pending->success"});
}

TEST_CASE("a throwing on_success fails the attempt", "[transaction][execution]") {
    ExecutionFixture f;
    TransactionExecutionOptions options;
    options.label = "grant";
    options.on_close = [&f] { ++f.closed; };
    options.on_success = [](const OperationResult &) { throw std::runtime_error("host failure"); };
    auto execution = TransactionExecution<GrantArgs>::create(f.handle, f.clock, std::move(options), f.hub);

    execution->execute(MINTER);
    REQUIRE_NOTHROW(f.handle->succeed());

    REQUIRE(execution->step() == TransactionStep::ERROR);
    REQUIRE(execution->error_message() == "host failure");
    REQUIRE_FALSE(execution->has_pending_close());
    f.clock->advance(SUCCESS_AUTO_CLOSE_DELAY);
    REQUIRE(f.closed == 0);
    REQUIRE(f.observer->events ==
            std::vector<std::string>{"grant form->pending", "grant pending->success", "grant success->error"});
}

TEST_CASE("a zero auto-close delay closes on a real time clock", "[transaction][execution]") {
    auto clock = std::make_shared<RealTimeEvaluationClock>();
    auto handle = std::make_shared<GrantHandle>();
    std::size_t closed{0};
    TransactionExecutionOptions options;
    options.auto_close_delay = 0ms;
    options.on_close = [&closed] { ++closed; };
    auto execution = TransactionExecution<GrantArgs>::create(handle, clock, std::move(options));

    for (std::size_t run = 0; run < 200; ++run) {
        execution->execute(MINTER);
        REQUIRE_NOTHROW(handle->succeed());
        REQUIRE(execution->step() == TransactionStep::SUCCESS);
        clock->run_until_next_alarm(5ms);
        REQUIRE(closed == run + 1);
    }
}

TEST_CASE("confirmation status moves pending to confirming", "[transaction][execution]") {
    ExecutionFixture f;
    auto execution = f.make_execution();

    execution->on_status_update(TxStatus::PENDING_CONFIRMATION);
    REQUIRE(execution->step() == TransactionStep::FORM);

    execution->execute(MINTER);
    execution->on_status_update(TxStatus::PENDING_SIGNATURE);
    REQUIRE(execution->step() == TransactionStep::PENDING);
    execution->on_status_update(TxStatus::PENDING_CONFIRMATION);
    REQUIRE(execution->step() == TransactionStep::CONFIRMING);
    REQUIRE(execution->is_transacting());

    f.handle->succeed();
    REQUIRE(execution->step() == TransactionStep::SUCCESS);
}

TEST_CASE("retry resubmits the last arguments", "[transaction][execution]") {
    ExecutionFixture f;
    auto execution = f.make_execution();

    SECTION("nothing to retry before the first submission") {
        execution->retry();
        REQUIRE(execution->step() == TransactionStep::FORM);
        REQUIRE(f.handle->submitted.empty());
    }

    SECTION("after an error") {
        execution->execute(MINTER);
        f.handle->fail("nonce too low");
        execution->retry();

        REQUIRE(execution->step() == TransactionStep::PENDING);
        REQUIRE_FALSE(execution->error_message().has_value());
        REQUIRE(f.handle->submitted.size() == 2);
        REQUIRE(f.handle->submitted.back().account == "0xdef");

        f.handle->succeed();
        REQUIRE(execution->step() == TransactionStep::SUCCESS);
    }
}

TEST_CASE("reset returns to form and cancels the close", "[transaction][execution]") {
    ExecutionFixture f;
    auto execution = f.make_execution();

    execution->execute(MINTER);
    f.handle->succeed();
    execution->reset();

    REQUIRE(execution->step() == TransactionStep::FORM);
    REQUIRE_FALSE(execution->has_pending_close());
    REQUIRE_FALSE(execution->last_args().has_value());
    REQUIRE(f.handle->reset_count == 1);

    f.clock->advance(5s);
    REQUIRE(f.closed == 0);
}

TEST_CASE("completions of superseded attempts are ignored", "[transaction][execution]") {
    ExecutionFixture f;
    auto execution = f.make_execution();

    execution->execute(MINTER);
    execution->reset();
    f.handle->succeed();

    REQUIRE(execution->step() == TransactionStep::FORM);
    REQUIRE(f.succeeded.empty());
    REQUIRE_FALSE(execution->has_pending_close());
}

TEST_CASE("completions after the execution is gone are dropped", "[transaction][execution]") {
    ExecutionFixture f;
    {
        auto execution = f.make_execution();
        execution->execute(MINTER);
    }
    REQUIRE_NOTHROW(f.handle->succeed());
    REQUIRE(f.succeeded.empty());
}

TEST_CASE("a synchronous submission failure is an error", "[transaction][execution]") {
    auto clock = make_clock();
    auto execution = TransactionExecution<GrantArgs>::create(std::make_shared<ThrowingHandle>(), clock);

    execution->execute(MINTER);
    REQUIRE(execution->step() == TransactionStep::ERROR);
    REQUIRE(execution->error_message() == "Adapter not connected");
}

TEST_CASE("can_submit follows the step and the handle", "[transaction][execution]") {
    ExecutionFixture f;
    auto execution = f.make_execution();

    REQUIRE(execution->can_submit());
    execution->execute(MINTER);
    REQUIRE_FALSE(execution->can_submit());
    f.handle->fail("RPC timeout");
    REQUIRE_FALSE(execution->can_submit());
    execution->reset();
    REQUIRE(execution->can_submit());
}

TEST_CASE("transaction execution validation", "[transaction][execution][config]") {
    auto clock = make_clock();
    REQUIRE_THROWS_AS(TransactionExecution<GrantArgs>::create(nullptr, clock), std::invalid_argument);
    REQUIRE_THROWS_AS(TransactionExecution<GrantArgs>::create(std::make_shared<GrantHandle>(), nullptr),
                      std::invalid_argument);

    TransactionExecutionOptions options;
    options.auto_close_delay = millis_t{-1};
    REQUIRE_THROWS_AS(TransactionExecution<GrantArgs>::create(std::make_shared<GrantHandle>(), clock, options),
                      std::invalid_argument);
}

// ============================================================================
// MultiMutationExecution
// ============================================================================

TEST_CASE("multi mutation execution drives a thunk", "[transaction][multi]") {
    auto clock = make_clock();
    std::deque<mutation_completion_t> completions;
    std::size_t invocations{0};
    auto thunk = [&](mutation_completion_t on_complete) {
        ++invocations;
        completions.push_back(std::move(on_complete));
    };

    std::size_t resets{0};
    std::optional<TransactionStep> step_at_close;
    MultiMutationExecution *raw{nullptr};

    MultiMutationExecutionOptions options;
    options.label = "batch";
    options.reset_mutations = {[&resets] { ++resets; }, [&resets] { ++resets; }};
    options.on_close = [&] { step_at_close = raw->step(); };
    auto execution = MultiMutationExecution::create(clock, std::move(options));
    raw = execution.get();

    SECTION("resets itself before on_close") {
        execution->execute(thunk);
        completions.front()(OperationResult{"batch-1"});
        REQUIRE(execution->step() == TransactionStep::SUCCESS);

        clock->advance(SUCCESS_AUTO_CLOSE_DELAY);
        REQUIRE(step_at_close == TransactionStep::FORM);
        REQUIRE(resets == 2);
    }

    SECTION("retry reuses the thunk") {
        execution->execute(thunk);
        completions.front()(std::make_exception_ptr(std::runtime_error("reverted")));
        REQUIRE(execution->step() == TransactionStep::ERROR);

        execution->retry();
        REQUIRE(invocations == 2);
        REQUIRE(execution->step() == TransactionStep::PENDING);
    }

    SECTION("reset forgets the thunk") {
        execution->execute(thunk);
        execution->reset();
        execution->retry();
        REQUIRE(invocations == 1);
        REQUIRE(execution->step() == TransactionStep::FORM);
        REQUIRE(resets == 2);
    }

    SECTION("rejects an empty thunk") {
        REQUIRE_THROWS_AS(execution->execute(nullptr), std::invalid_argument);
    }
}

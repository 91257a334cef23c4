#ifndef TXSYNC_TRANSACTION_EXECUTION_H
#define TXSYNC_TRANSACTION_EXECUTION_H

#include <txsync/runtime/evaluation_clock.h>
#include <txsync/runtime/observers/reconciliation_observer.h>
#include <txsync/transaction/transaction_step.h>

#include <exception>
#include <mutex>
#include <variant>
#include <vector>

namespace txsync {
    inline constexpr millis_t SUCCESS_AUTO_CLOSE_DELAY{1'500};

    /**
     * The outcome of a submitted write, as reported by the submission layer.
     */
    struct OperationResult {
        std::string id;
    };

    using MutationOutcome = std::variant<OperationResult, std::exception_ptr>;
    using mutation_completion_t = std::function<void(MutationOutcome)>;

    /**
     * True when the message reads as the user declining the request in their wallet (case-insensitive match on
     * rejected, cancelled, denied or "user refused").
     */
    TXSYNC_EXPORT bool is_user_rejection_error(std::string_view message);

    /**
     * The write-submission layer (wallet + chain adapter) for one kind of mutation.
     */
    template<typename Args>
    struct MutationHandle {
        using s_ptr = std::shared_ptr<MutationHandle>;

        virtual ~MutationHandle() = default;

        /**
         * Submit the write. ``on_complete`` is called exactly once, on any thread, with the result or the failure.
         */
        virtual void mutate_async(const Args &args, mutation_completion_t on_complete) = 0;

        virtual void reset() = 0;

        [[nodiscard]] virtual TxStatus status() const = 0;

        [[nodiscard]] virtual bool is_pending() const = 0;
    };

    struct TXSYNC_EXPORT TransactionExecutionOptions {
        std::function<void()> on_close;
        std::function<void(const OperationResult &)> on_success;
        millis_t auto_close_delay{SUCCESS_AUTO_CLOSE_DELAY};
        // Identifies the execution in trace output
        std::string label{"transaction"};

        void validate() const;
    };

    /**
     * The step machine shared by the single and multi mutation executions:
     *
     *   form -> pending [-> confirming] -> success | error | cancelled
     *   error | cancelled -> pending (retry)
     *   any -> form (reset)
     *
     * Each submission is an attempt; a completion for an attempt that has since been superseded by reset or a new
     * submission is ignored. User callbacks are invoked without the state lock held.
     */
    class TXSYNC_EXPORT TransactionExecutionBase : public std::enable_shared_from_this<TransactionExecutionBase> {
    public:
        using s_ptr = std::shared_ptr<TransactionExecutionBase>;

        TransactionExecutionBase(const TransactionExecutionBase &) = delete;

        TransactionExecutionBase &operator=(const TransactionExecutionBase &) = delete;

        virtual ~TransactionExecutionBase();

        [[nodiscard]] TransactionStep step() const;

        [[nodiscard]] std::optional<std::string> error_message() const;

        [[nodiscard]] bool is_transacting() const;

        /**
         * Progress reported by the submission layer; pending_confirmation moves a pending execution to confirming.
         */
        void on_status_update(TxStatus status);

        [[nodiscard]] bool has_pending_close() const;

        [[nodiscard]] const std::string &label() const { return _options.label; }

    protected:
        TransactionExecutionBase(EvaluationClock::s_ptr clock, TransactionExecutionOptions options,
                                 ObserverHub::s_ptr observers);

        /**
         * Starts a new attempt and hands ``submit`` the completion bound to it. A synchronous throw from
         * ``submit`` is treated as a failed completion.
         */
        void submit_attempt(const std::function<void(mutation_completion_t)> &submit);

        /**
         * Back to form, cancelling the auto-close and invalidating any in-flight attempt.
         */
        void reset_state();

        // Invoked on the auto-close alarm, immediately before on_close
        virtual void before_close() {
        }

    private:
        void _complete(std::uint64_t attempt, MutationOutcome outcome);

        void _transition(TransactionStep to, std::optional<std::string> error_message);

        void _schedule_close(std::uint64_t attempt);

        void _close(std::uint64_t attempt);

        EvaluationClock::s_ptr _clock;
        TransactionExecutionOptions _options;
        ObserverHub::s_ptr _observers;
        std::string _alarm_name;

        mutable std::mutex _mutex;
        TransactionStep _step{TransactionStep::FORM};
        std::optional<std::string> _error_message;
        std::uint64_t _attempt{0};
    };

    /**
     * Drives one mutation handle with fixed arguments through the transaction steps.
     */
    template<typename Args>
    class TransactionExecution : public TransactionExecutionBase {
    public:
        using s_ptr = std::shared_ptr<TransactionExecution>;
        using handle_s_ptr = typename MutationHandle<Args>::s_ptr;

        static s_ptr create(handle_s_ptr mutation, EvaluationClock::s_ptr clock,
                            TransactionExecutionOptions options = {}, ObserverHub::s_ptr observers = {}) {
            return s_ptr(new TransactionExecution(std::move(mutation), std::move(clock), std::move(options),
                                                  std::move(observers)));
        }

        void execute(Args args) {
            {
                std::lock_guard<std::mutex> lock(_args_mutex);
                _last_args = args;
            }
            _submit(std::move(args));
        }

        /**
         * Re-submits the last arguments, a no-op when there are none.
         */
        void retry() {
            std::optional<Args> args;
            {
                std::lock_guard<std::mutex> lock(_args_mutex);
                args = _last_args;
            }
            if (!args) { return; }
            _submit(std::move(*args));
        }

        void reset() {
            {
                std::lock_guard<std::mutex> lock(_args_mutex);
                _last_args.reset();
            }
            reset_state();
            _mutation->reset();
        }

        [[nodiscard]] bool can_submit() const {
            return step() == TransactionStep::FORM && !_mutation->is_pending();
        }

        [[nodiscard]] std::optional<Args> last_args() const {
            std::lock_guard<std::mutex> lock(_args_mutex);
            return _last_args;
        }

        [[nodiscard]] const handle_s_ptr &mutation() const { return _mutation; }

    protected:
        TransactionExecution(handle_s_ptr mutation, EvaluationClock::s_ptr clock, TransactionExecutionOptions options,
                             ObserverHub::s_ptr observers)
            : TransactionExecutionBase(std::move(clock), std::move(options), std::move(observers)),
              _mutation{std::move(mutation)} {
            if (!_mutation) { throw_error<std::invalid_argument>("TransactionExecution requires a mutation handle"); }
        }

    private:
        void _submit(Args args) {
            submit_attempt([this, &args](mutation_completion_t on_complete) {
                _mutation->mutate_async(args, std::move(on_complete));
            });
        }

        handle_s_ptr _mutation;
        mutable std::mutex _args_mutex;
        std::optional<Args> _last_args;
    };

    // A no-argument write, completing through the supplied callback
    using mutation_thunk_t = std::function<void(mutation_completion_t)>;

    struct TXSYNC_EXPORT MultiMutationExecutionOptions : TransactionExecutionOptions {
        // Reset functions of every write mechanism the thunks use
        std::vector<std::function<void()> > reset_mutations;
    };

    /**
     * As TransactionExecution, but each submission is an arbitrary thunk that may drive several mutations. Resets
     * itself just before invoking on_close.
     */
    class TXSYNC_EXPORT MultiMutationExecution : public TransactionExecutionBase {
    public:
        using s_ptr = std::shared_ptr<MultiMutationExecution>;

        static s_ptr create(EvaluationClock::s_ptr clock, MultiMutationExecutionOptions options = {},
                            ObserverHub::s_ptr observers = {});

        void execute(mutation_thunk_t fn);

        void retry();

        void reset();

    protected:
        MultiMutationExecution(EvaluationClock::s_ptr clock, MultiMutationExecutionOptions options,
                               ObserverHub::s_ptr observers);

        void before_close() override;

    private:
        std::vector<std::function<void()> > _reset_mutations;
        mutable std::mutex _fn_mutex;
        mutation_thunk_t _last_fn;
    };
} // namespace txsync

#endif  // TXSYNC_TRANSACTION_EXECUTION_H

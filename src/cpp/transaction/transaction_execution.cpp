#include <txsync/transaction/transaction_execution.h>
#include <txsync/util/string_utils.h>

#include <array>

namespace txsync {
    bool is_user_rejection_error(std::string_view message) {
        static constexpr std::array<std::string_view, 4> markers{"rejected", "cancelled", "denied", "user refused"};
        auto lowered = to_lower(message);
        for (auto marker: markers) {
            if (contains(lowered, marker)) { return true; }
        }
        return false;
    }

    void TransactionExecutionOptions::validate() const {
        if (auto_close_delay.count() < 0) {
            throw_error<std::invalid_argument>("auto_close_delay must not be negative, got {}ms",
                                               auto_close_delay.count());
        }
    }

    TransactionExecutionBase::TransactionExecutionBase(EvaluationClock::s_ptr clock,
                                                       TransactionExecutionOptions options,
                                                       ObserverHub::s_ptr observers)
        : _clock{std::move(clock)}, _options{std::move(options)}, _observers{std::move(observers)},
          _alarm_name{fmt::format("auto_close:{}@{}", _options.label, fmt::ptr(this))} {
        if (!_clock) { throw_error<std::invalid_argument>("Transaction execution requires a clock"); }
        _options.validate();
    }

    TransactionExecutionBase::~TransactionExecutionBase() { _clock->cancel_alarm(_alarm_name); }

    TransactionStep TransactionExecutionBase::step() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _step;
    }

    std::optional<std::string> TransactionExecutionBase::error_message() const {
        std::lock_guard<std::mutex> lock(_mutex);
        return _error_message;
    }

    bool TransactionExecutionBase::is_transacting() const {
        auto current = step();
        return current == TransactionStep::PENDING || current == TransactionStep::CONFIRMING;
    }

    void TransactionExecutionBase::on_status_update(TxStatus status) {
        if (status != TxStatus::PENDING_CONFIRMATION) { return; }
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (_step != TransactionStep::PENDING) { return; }
        }
        _transition(TransactionStep::CONFIRMING, std::nullopt);
    }

    bool TransactionExecutionBase::has_pending_close() const { return _clock->has_alarm(_alarm_name); }

    void TransactionExecutionBase::submit_attempt(const std::function<void(mutation_completion_t)> &submit) {
        _clock->cancel_alarm(_alarm_name);
        std::uint64_t attempt;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            attempt = ++_attempt;
        }
        _transition(TransactionStep::PENDING, std::nullopt);

        std::weak_ptr<TransactionExecutionBase> weak = weak_from_this();
        mutation_completion_t on_complete = [weak, attempt](MutationOutcome outcome) {
            if (auto self = weak.lock()) { self->_complete(attempt, std::move(outcome)); }
        };
        try {
            submit(on_complete);
        } catch (...) {
            _complete(attempt, std::current_exception());
        }
    }

    void TransactionExecutionBase::reset_state() {
        _clock->cancel_alarm(_alarm_name);
        {
            std::lock_guard<std::mutex> lock(_mutex);
            ++_attempt;
        }
        _transition(TransactionStep::FORM, std::nullopt);
    }

    void TransactionExecutionBase::_complete(std::uint64_t attempt, MutationOutcome outcome) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (attempt != _attempt) { return; }
            if (_step != TransactionStep::PENDING && _step != TransactionStep::CONFIRMING) { return; }
        }

        std::exception_ptr failure;
        if (auto *result = std::get_if<OperationResult>(&outcome)) {
            _transition(TransactionStep::SUCCESS, std::nullopt);
            // A throwing success handler fails the attempt like a failed write
            try {
                if (_options.on_success) { _options.on_success(*result); }
            } catch (...) {
                failure = std::current_exception();
            }
            if (!failure) {
                _schedule_close(attempt);
                return;
            }
        } else {
            failure = std::get<std::exception_ptr>(outcome);
        }

        auto message = exception_message(failure);
        if (is_user_rejection_error(message)) {
            _transition(TransactionStep::CANCELLED, std::nullopt);
        } else {
            _transition(TransactionStep::ERROR, std::move(message));
        }
    }

    void TransactionExecutionBase::_schedule_close(std::uint64_t attempt) {
        std::weak_ptr<TransactionExecutionBase> weak = weak_from_this();
        _clock->set_alarm_after(_options.auto_close_delay, _alarm_name, [weak, attempt](engine_time_t) {
            if (auto self = weak.lock()) { self->_close(attempt); }
        });
    }

    void TransactionExecutionBase::_close(std::uint64_t attempt) {
        {
            std::lock_guard<std::mutex> lock(_mutex);
            if (attempt != _attempt) { return; }
        }
        before_close();
        if (_options.on_close) { _options.on_close(); }
    }

    void TransactionExecutionBase::_transition(TransactionStep to, std::optional<std::string> error_message) {
        TransactionStep from;
        {
            std::lock_guard<std::mutex> lock(_mutex);
            from = _step;
            _step = to;
            _error_message = error_message;
        }
        if (_observers && from != to) { _observers->notify_transaction_step(_options.label, from, to, error_message); }
    }

    MultiMutationExecution::s_ptr MultiMutationExecution::create(EvaluationClock::s_ptr clock,
                                                                 MultiMutationExecutionOptions options,
                                                                 ObserverHub::s_ptr observers) {
        return s_ptr(new MultiMutationExecution(std::move(clock), std::move(options), std::move(observers)));
    }

    MultiMutationExecution::MultiMutationExecution(EvaluationClock::s_ptr clock, MultiMutationExecutionOptions options,
                                                   ObserverHub::s_ptr observers)
        : TransactionExecutionBase(std::move(clock), static_cast<TransactionExecutionOptions>(options),
                                   std::move(observers)),
          _reset_mutations{std::move(options.reset_mutations)} {
    }

    void MultiMutationExecution::execute(mutation_thunk_t fn) {
        if (!fn) { throw_error<std::invalid_argument>("MultiMutationExecution::execute requires a mutation"); }
        {
            std::lock_guard<std::mutex> lock(_fn_mutex);
            _last_fn = fn;
        }
        submit_attempt(fn);
    }

    void MultiMutationExecution::retry() {
        mutation_thunk_t fn;
        {
            std::lock_guard<std::mutex> lock(_fn_mutex);
            fn = _last_fn;
        }
        if (!fn) { return; }
        submit_attempt(fn);
    }

    void MultiMutationExecution::reset() {
        {
            std::lock_guard<std::mutex> lock(_fn_mutex);
            _last_fn = nullptr;
        }
        reset_state();
        for (auto &reset_fn: _reset_mutations) {
            if (reset_fn) { reset_fn(); }
        }
    }

    void MultiMutationExecution::before_close() { reset(); }
} // namespace txsync

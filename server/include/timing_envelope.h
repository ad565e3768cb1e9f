#pragma once
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <memory>
#include <type_traits>
#include <utility>

namespace trantor {
class EventLoop;
}

namespace gwauth {

/*
Timing-uniform responses
========================

Authentication outcomes ("no such key", "wrong key", "expired", "store error")
must not be distinguishable by latency. Every protected operation:

  1. draws jitter ~ Uniform(0, max_jitter) once and waits it out *before* the
     work starts, hiding path-dependent timing from the first byte on;
  2. runs the operation;
  3. waits until at least min_delay has elapsed since step 1 began.

All waits are event-loop timers (DelayScheduler). No worker thread ever sleeps,
so a bounded IO pool keeps serving other requests while these are parked.

There is no cancellation: once entered, the floor always completes, even when
the peer has gone away, so an early disconnect cannot become a timing signal.
*/

struct TimingContract {
    std::chrono::milliseconds min_delay{0};
    std::chrono::milliseconds max_jitter{0};

    // false: a failing operation skips the floor and completes right away.
    bool apply_to_failures = true;
};

namespace timing {
    inline TimingContract login()              { return {std::chrono::milliseconds(500), std::chrono::milliseconds(100), true}; }
    inline TimingContract signup()             { return {std::chrono::milliseconds(600), std::chrono::milliseconds(150), true}; }
    inline TimingContract password_reset()     { return {std::chrono::milliseconds(500), std::chrono::milliseconds(100), true}; }
    inline TimingContract license_validation() { return {std::chrono::milliseconds(300), std::chrono::milliseconds(50),  true}; }
} // namespace timing

// Non-blocking deferred execution.
class DelayScheduler {
public:
    virtual ~DelayScheduler() = default;

    // Runs fn once, no earlier than `delay` from now. Never runs fn inline,
    // even for a zero delay.
    virtual void run_after(std::chrono::nanoseconds delay, std::function<void()> fn) = 0;
};

// Timers on trantor event loops. Called from an event-loop thread (a drogon IO
// thread) the timer is armed on that same loop, so a request resumes on the
// worker that parked it; other threads use the fallback loop.
class LoopDelayScheduler : public DelayScheduler {
public:
    explicit LoopDelayScheduler(trantor::EventLoop* fallback_loop);

    void run_after(std::chrono::nanoseconds delay, std::function<void()> fn) override;

private:
    trantor::EventLoop* fallback_;
};

/*
TimingScope
===========

Scoped-block form: protects an arbitrary critical section instead of a single
callable.

  TimingScope::enter(sched, contract, [](const std::shared_ptr<TimingScope>& scope) {
      ... critical section, may itself be asynchronous ...
      scope->leave([] { ... reply ... });
  });

- body runs after the initial jitter
- leave(cont) runs cont once the floor is reached
- leave_now(cont) skips the floor (fail-fast branches)

If body throws before leaving, the exception is handed unchanged to on_error
once the floor is reached (right away when apply_to_failures is false). An
exception thrown after a leave, or with no on_error, is logged and dropped.
Only the first leave, or the failure path, has an effect.
*/
class TimingScope : public std::enable_shared_from_this<TimingScope> {
    struct Key {};

public:
    using Body = std::function<void(const std::shared_ptr<TimingScope>&)>;
    using OnError = std::function<void(std::exception_ptr)>;

    TimingScope(Key, DelayScheduler& scheduler, const TimingContract& contract);

    static void enter(DelayScheduler& scheduler, const TimingContract& contract, Body body,
                      OnError on_error = nullptr);

    void leave(std::function<void()> cont);
    void leave_now(std::function<void()> cont);

    const TimingContract& contract() const { return contract_; }
    std::chrono::nanoseconds jitter() const { return jitter_; }
    std::chrono::nanoseconds elapsed() const;

private:
    void fail(std::exception_ptr error, OnError on_error);
    void finish_when_due(std::function<void()> cont);
    void log_done(const char* how) const;

    DelayScheduler& scheduler_;
    TimingContract contract_;
    std::chrono::steady_clock::time_point start_;
    std::chrono::nanoseconds jitter_{0};
    std::atomic<bool> left_{false};
};

// Result slot handed to wrap() completions. get() rethrows the operation's
// exception unchanged.
template <typename T>
struct Outcome {
    T value{};
    std::exception_ptr error;

    bool ok() const { return !error; }

    const T& get() const {
        if (error) std::rethrow_exception(error);
        return value;
    }
};

/*
TimingEnvelope
==============

Higher-order form. wrap(op, contract, done) runs a synchronous, non-void op
inside a TimingScope and hands its value or exception to done once the
contract is satisfied. wrapped(op, contract) returns the protected operation
itself for handlers that want to pass it around.
*/
class TimingEnvelope {
public:
    explicit TimingEnvelope(DelayScheduler& scheduler) : scheduler_(scheduler) {}

    template <typename Op>
    using ResultOf = std::decay_t<std::invoke_result_t<Op&>>;

    template <typename Op>
    void wrap(Op op, const TimingContract& contract,
              std::function<void(Outcome<ResultOf<Op>>)> done) {
        using T = ResultOf<Op>;
        static_assert(!std::is_void<T>::value, "wrap() needs a value-returning operation");

        TimingScope::enter(scheduler_, contract,
            [op = std::move(op), done = std::move(done)](const std::shared_ptr<TimingScope>& scope) mutable {
                auto out = std::make_shared<Outcome<T>>();
                try {
                    out->value = op();
                } catch (...) {
                    // Carried to done() and rethrown by Outcome::get().
                    out->error = std::current_exception();
                }

                auto deliver = [out, done]() { done(*out); };
                if (out->error && !scope->contract().apply_to_failures)
                    scope->leave_now(std::move(deliver));
                else
                    scope->leave(std::move(deliver));
            });
    }

    template <typename Op>
    std::function<void(std::function<void(Outcome<ResultOf<Op>>)>)>
    wrapped(Op op, const TimingContract& contract) {
        return [this, op, contract](std::function<void(Outcome<ResultOf<Op>>)> done) {
            wrap(op, contract, std::move(done));
        };
    }

    DelayScheduler& scheduler() { return scheduler_; }

private:
    DelayScheduler& scheduler_;
};

} // namespace gwauth

#include "timing_envelope.h"
#include "gwauth_util.h"

#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>

#include <sodium.h>
#include <trantor/net/EventLoop.h>

namespace gwauth {

LoopDelayScheduler::LoopDelayScheduler(trantor::EventLoop* fallback_loop)
    : fallback_(fallback_loop) {
    if (!fallback_) throw std::invalid_argument("LoopDelayScheduler: fallback loop is null");
}

void LoopDelayScheduler::run_after(std::chrono::nanoseconds delay, std::function<void()> fn) {
    trantor::EventLoop* loop = trantor::EventLoop::getEventLoopOfCurrentThread();
    if (!loop) loop = fallback_;

    if (delay.count() <= 0) {
        loop->queueInLoop(std::move(fn));
        return;
    }
    loop->runAfter(std::chrono::duration<double>(delay).count(), std::move(fn));
}

// Uniform in [0, max_jitter] at microsecond granularity (libsodium CSPRNG,
// unbiased).
static std::chrono::nanoseconds sample_jitter(std::chrono::milliseconds max_jitter) {
    if (max_jitter.count() <= 0) return std::chrono::nanoseconds(0);

    const auto us = std::chrono::duration_cast<std::chrono::microseconds>(max_jitter).count();
    const auto upper = (uint64_t)us + 1;
    const uint32_t bound = upper > std::numeric_limits<uint32_t>::max()
                               ? std::numeric_limits<uint32_t>::max()
                               : (uint32_t)upper;
    return std::chrono::microseconds(randombytes_uniform(bound));
}

TimingScope::TimingScope(Key, DelayScheduler& scheduler, const TimingContract& contract)
    : scheduler_(scheduler),
      contract_(contract),
      start_(std::chrono::steady_clock::now()),
      jitter_(sample_jitter(contract.max_jitter)) {}

void TimingScope::enter(DelayScheduler& scheduler, const TimingContract& contract, Body body,
                        OnError on_error) {
    auto scope = std::make_shared<TimingScope>(Key{}, scheduler, contract);

    scheduler.run_after(scope->jitter_,
        [scope, body = std::move(body), on_error = std::move(on_error)]() mutable {
            try {
                body(scope);
            } catch (...) {
                scope->fail(std::current_exception(), std::move(on_error));
            }
        });
}

void TimingScope::fail(std::exception_ptr error, OnError on_error) {
    if (!on_error || left_.exchange(true)) {
        std::string what = "non-standard exception";
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
        }
        std::cerr << "[timing] ERROR: protected block threw with no one to report to: "
                  << what << std::endl;
        return;
    }

    auto deliver = [error, on_error = std::move(on_error)]() { on_error(error); };
    if (!contract_.apply_to_failures) {
        log_done("bypass");
        deliver();
        return;
    }
    finish_when_due(std::move(deliver));
}

std::chrono::nanoseconds TimingScope::elapsed() const {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_);
}

void TimingScope::leave(std::function<void()> cont) {
    if (left_.exchange(true)) return;
    finish_when_due(std::move(cont));
}

void TimingScope::leave_now(std::function<void()> cont) {
    if (left_.exchange(true)) return;
    log_done("bypass");
    cont();
}

void TimingScope::finish_when_due(std::function<void()> cont) {
    const auto remaining = std::chrono::duration_cast<std::chrono::nanoseconds>(contract_.min_delay) - elapsed();
    if (remaining.count() <= 0) {
        log_done("floor");
        cont();
        return;
    }

    // Timers are rounded to the loop's resolution; re-check on wake-up so the
    // floor is never undershot.
    auto self = shared_from_this();
    scheduler_.run_after(remaining, [self, cont = std::move(cont)]() mutable {
        self->finish_when_due(std::move(cont));
    });
}

void TimingScope::log_done(const char* how) const {
    if (!debug_enabled()) return;
    using std::chrono::duration_cast;
    using std::chrono::microseconds;
    std::cerr << "[timing] " << how
              << " elapsed_us=" << duration_cast<microseconds>(elapsed()).count()
              << " min_ms=" << contract_.min_delay.count()
              << " jitter_us=" << duration_cast<microseconds>(jitter_).count()
              << std::endl;
}

} // namespace gwauth

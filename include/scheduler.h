// Copyright (C) 2025-2026 356C LLC
// SPDX-License-Identifier: GPL-3.0-or-later

#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <utility>

namespace kiosk {

using TimerId = uint64_t;
using TimerCallback = std::function<void()>;

/// Returned by set_timeout()/set_interval() on failure; cancel() ignores it.
constexpr TimerId INVALID_TIMER = 0;

/**
 * @brief Abstract clock and timer service
 *
 * Every time-dependent component (orchestrator tick, idle timeout, gesture
 * timeout, maintenance interval, animation fallback) takes a Scheduler&
 * instead of reading the wall clock, so tests can drive time explicitly.
 *
 * All callbacks run on the thread that pumps the scheduler.
 */
class Scheduler {
  public:
    virtual ~Scheduler() = default;

    /**
     * @brief Current time in milliseconds (monotonic, arbitrary epoch)
     */
    virtual uint64_t now_ms() const = 0;

    /**
     * @brief Run callback once, delay_ms from now
     * @return Timer id for cancel()
     */
    virtual TimerId set_timeout(uint32_t delay_ms, TimerCallback callback) = 0;

    /**
     * @brief Run callback every period_ms until cancelled
     * @return Timer id for cancel()
     */
    virtual TimerId set_interval(uint32_t period_ms, TimerCallback callback) = 0;

    /**
     * @brief Cancel a pending timer
     * @return true if the timer was pending and is now cancelled
     */
    virtual bool cancel(TimerId id) = 0;
};

/**
 * @brief Timer list pumped explicitly by the host loop
 *
 * The host calls run_due() once per frame (or from an LVGL timer, see
 * lvgl_binding.h). The time source is injectable; tests pass a lambda over a
 * manually advanced counter.
 *
 * Timers created while run_due() is executing are not considered until the
 * next run_due() call, so a zero-delay timer cannot starve the loop.
 */
class LoopScheduler : public Scheduler {
  public:
    using TimeSource = std::function<uint64_t()>;

    /**
     * @brief Construct with std::chrono::steady_clock as time source
     */
    LoopScheduler();

    explicit LoopScheduler(TimeSource time_source);

    LoopScheduler(const LoopScheduler&) = delete;
    LoopScheduler& operator=(const LoopScheduler&) = delete;

    uint64_t now_ms() const override;
    TimerId set_timeout(uint32_t delay_ms, TimerCallback callback) override;
    TimerId set_interval(uint32_t period_ms, TimerCallback callback) override;
    bool cancel(TimerId id) override;

    /**
     * @brief Fire every timer whose due time is <= now_ms()
     *
     * Due timers fire in due-time order, ties broken by creation order.
     * @return Number of callbacks invoked
     */
    size_t run_due();

    /**
     * @brief Number of armed timers
     */
    size_t pending() const {
        return timers_.size();
    }

    /**
     * @brief Due time of the earliest armed timer, or 0 when none
     */
    uint64_t next_due() const;

  private:
    struct Timer {
        uint64_t due_ms = 0;
        uint32_t period_ms = 0; // 0 = one-shot
        TimerCallback callback;
    };

    TimerId add_timer(uint32_t delay_ms, uint32_t period_ms, TimerCallback callback);

    TimeSource time_source_;
    std::map<TimerId, Timer> timers_;
    TimerId next_id_ = 1;
};

/**
 * @brief RAII owner of one scheduler timer
 *
 * Cancels the timer on destruction or when re-armed. The Scheduler must
 * outlive the guard.
 */
class TimerGuard {
  public:
    TimerGuard() = default;
    explicit TimerGuard(Scheduler& scheduler) : scheduler_(&scheduler) {}

    ~TimerGuard() {
        reset();
    }

    TimerGuard(TimerGuard&& other) noexcept
        : scheduler_(other.scheduler_), id_(std::exchange(other.id_, INVALID_TIMER)) {}

    TimerGuard& operator=(TimerGuard&& other) noexcept {
        if (this != &other) {
            reset();
            scheduler_ = other.scheduler_;
            id_ = std::exchange(other.id_, INVALID_TIMER);
        }
        return *this;
    }

    TimerGuard(const TimerGuard&) = delete;
    TimerGuard& operator=(const TimerGuard&) = delete;

    void start_timeout(uint32_t delay_ms, TimerCallback callback) {
        reset();
        id_ = scheduler_->set_timeout(delay_ms, std::move(callback));
    }

    void start_interval(uint32_t period_ms, TimerCallback callback) {
        reset();
        id_ = scheduler_->set_interval(period_ms, std::move(callback));
    }

    void reset() {
        if (id_ != INVALID_TIMER && scheduler_) {
            scheduler_->cancel(id_);
        }
        id_ = INVALID_TIMER;
    }

    /**
     * @brief Mark a one-shot timer as consumed (call from inside its callback)
     */
    void clear() {
        id_ = INVALID_TIMER;
    }

    bool armed() const {
        return id_ != INVALID_TIMER;
    }

  private:
    Scheduler* scheduler_ = nullptr;
    TimerId id_ = INVALID_TIMER;
};

} // namespace kiosk

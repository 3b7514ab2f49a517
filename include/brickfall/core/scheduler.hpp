// Brickfall Core
// scheduler.hpp - Deferred callback scheduling on a host-driven clock

#pragma once

#include <cstdint>
#include <functional>
#include <memory>

namespace brickfall::core {

using ScheduledCallback = std::function<void()>;

using ScheduleHandle = uint64_t;

inline constexpr ScheduleHandle INVALID_SCHEDULE_HANDLE = 0;

// ============================================================================
// Scheduler Interface
// ============================================================================

// Timer facility owned by the host. Callbacks run on the host thread.
class IScheduler {
public:
    virtual ~IScheduler() = default;

    // Run callback once, delay_ms after the current time
    virtual ScheduleHandle schedule(ScheduledCallback callback, double delay_ms) = 0;

    // Returns true if the callback was still pending
    virtual bool cancel(ScheduleHandle handle) = 0;
};

// ============================================================================
// Deferred Scheduler
// ============================================================================

// Manual-clock scheduler: the host advances time once per tick and due
// callbacks fire in (due time, schedule order). Callbacks may schedule or
// cancel further callbacks while running.
class DeferredScheduler : public IScheduler {
public:
    DeferredScheduler();
    ~DeferredScheduler() override;

    // Non-copyable, non-movable
    DeferredScheduler(const DeferredScheduler&) = delete;
    DeferredScheduler& operator=(const DeferredScheduler&) = delete;
    DeferredScheduler(DeferredScheduler&&) = delete;
    DeferredScheduler& operator=(DeferredScheduler&&) = delete;

    // ========================================================================
    // IScheduler Implementation
    // ========================================================================

    ScheduleHandle schedule(ScheduledCallback callback, double delay_ms) override;
    bool cancel(ScheduleHandle handle) override;

    // ========================================================================
    // Clock
    // ========================================================================

    // Advance the clock to now_ms, firing every callback due on the way.
    // Returns the number of callbacks fired.
    size_t advance_to(double now_ms);
    size_t advance_by(double delta_ms);

    // Fire everything pending, in order, regardless of due time
    size_t run_all();

    [[nodiscard]] double now() const;

    // ========================================================================
    // Queries
    // ========================================================================

    [[nodiscard]] size_t pending_count() const;
    [[nodiscard]] bool is_pending(ScheduleHandle handle) const;

    // Time the next callback is due, or a negative value when idle
    [[nodiscard]] double next_due_time() const;

    void cancel_all();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace brickfall::core

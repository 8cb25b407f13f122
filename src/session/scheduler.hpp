#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace neetings::session {

/**
 * ScheduledTask - handle to a callback scheduled on a Scheduler.
 *
 * Destroying the handle cancels the callback. A handle must not be
 * destroyed from inside its own callback; cancel() it or keep it until the
 * next schedule instead.
 */
class ScheduledTask {
public:
    virtual ~ScheduledTask() = default;

    virtual void cancel() = 0;

    /**
     * True until the callback has run or the task was cancelled.
     */
    [[nodiscard]] virtual bool pending() const = 0;
};

/**
 * Scheduler - runs callbacks later on the caller's thread.
 */
class Scheduler {
public:
    virtual ~Scheduler() = default;

    [[nodiscard]] virtual std::unique_ptr<ScheduledTask> schedule_after(
        std::chrono::milliseconds delay, std::function<void()> callback) = 0;
};

} // namespace neetings::session

#pragma once

#include "session/scheduler.hpp"

namespace neetings::session {

/**
 * QtScheduler - Scheduler backed by single-shot QTimers on the current
 * thread's event loop. Callbacks only run while that loop is spinning.
 */
class QtScheduler final : public Scheduler {
public:
    [[nodiscard]] std::unique_ptr<ScheduledTask> schedule_after(
        std::chrono::milliseconds delay, std::function<void()> callback) override;
};

} // namespace neetings::session

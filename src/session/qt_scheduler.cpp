#include "session/qt_scheduler.hpp"

#include <QTimer>

namespace neetings::session {

namespace {

class QtScheduledTask final : public ScheduledTask {
public:
    QtScheduledTask(std::chrono::milliseconds delay, std::function<void()> callback)
        : timer_(std::make_unique<QTimer>())
        , callback_(std::move(callback))
    {
        timer_->setSingleShot(true);
        timer_->setTimerType(Qt::PreciseTimer);
        QObject::connect(timer_.get(), &QTimer::timeout, [this]() {
            fired_ = true;
            // The callback may end up destroying this task; run a copy.
            const auto callback = callback_;
            if (callback) callback();
        });
        timer_->start(delay);
    }

    ~QtScheduledTask() override {
        timer_->stop();
    }

    void cancel() override {
        timer_->stop();
    }

    [[nodiscard]] bool pending() const override {
        return !fired_ && timer_->isActive();
    }

private:
    std::unique_ptr<QTimer> timer_;
    std::function<void()> callback_;
    bool fired_ = false;
};

} // namespace

std::unique_ptr<ScheduledTask> QtScheduler::schedule_after(
    std::chrono::milliseconds delay, std::function<void()> callback) {
    return std::make_unique<QtScheduledTask>(delay, std::move(callback));
}

} // namespace neetings::session

#pragma once

#include "core/meeting.hpp"
#include "core/result.hpp"
#include "session/logging.hpp"
#include "session/scheduler.hpp"
#include "storage/durable_store.hpp"

#include <QDebug>

#include <algorithm>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace neetings::session {

inline constexpr std::chrono::milliseconds DEFAULT_AUTOSAVE_DELAY{500};

/**
 * UpdateQueue - owner of one entity collection and of its persistence.
 *
 * All reads come from memory, so a caller sees its own change right after
 * issuing it. Debounced mutations (queue_update / queue_add / queue_remove)
 * apply to memory immediately and (re)start a trailing-edge timer; when it
 * fires, the whole current collection is encoded and written under one key.
 * set_all, flush_all and clear_all hit the store immediately.
 *
 * A failed write is logged and reported to the failure handler. Memory is
 * never rolled back; the ids touched since the last good write stay in
 * pending_ids() until a later write succeeds.
 *
 * Entity must have a std::string `id` member.
 */
template<typename Entity>
class UpdateQueue {
public:
    using Encoder = std::function<std::string(const std::vector<Entity>&)>;
    using Decoder = std::function<Result<std::vector<Entity>, Error>(const std::string&)>;
    using WriteFailureHandler = std::function<void(const Error&)>;

    struct Options {
        std::string storage_key;
        std::chrono::milliseconds delay{DEFAULT_AUTOSAVE_DELAY};
    };

    UpdateQueue(storage::DurableStore& store, Scheduler& scheduler, Encoder encode, Options options)
        : store_(store)
        , scheduler_(scheduler)
        , encode_(std::move(encode))
        , options_(std::move(options))
    {}

    ~UpdateQueue() {
        destroy();
    }

    UpdateQueue(const UpdateQueue&) = delete;
    UpdateQueue& operator=(const UpdateQueue&) = delete;

    /**
     * Replace memory with the stored document. A missing document loads as
     * an empty collection. Does not schedule a write.
     */
    [[nodiscard]] Result<void, Error> load(const Decoder& decode) {
        auto raw = store_.get(options_.storage_key);
        if (raw.is_err()) {
            qCWarning(neetingsQueueLog) << "load of" << options_.storage_key.c_str()
                                        << "failed:" << raw.unwrap_err().message.c_str();
            return Result<void, Error>::err(raw.unwrap_err());
        }

        const auto& value = raw.unwrap();
        if (!value) {
            entities_.clear();
            return Result<void, Error>::ok();
        }

        auto decoded = decode(*value);
        if (decoded.is_err()) {
            qCWarning(neetingsQueueLog) << "decode of" << options_.storage_key.c_str()
                                        << "failed:" << decoded.unwrap_err().message.c_str();
            return Result<void, Error>::err(decoded.unwrap_err());
        }

        entities_ = std::move(decoded).unwrap();
        pending_ids_.clear();
        qCDebug(neetingsQueueLog) << "loaded" << entities_.size() << "entities from"
                                  << options_.storage_key.c_str();
        return Result<void, Error>::ok();
    }

    [[nodiscard]] const std::vector<Entity>& get_all() const noexcept { return entities_; }

    [[nodiscard]] std::optional<Entity> get(const std::string& id) const {
        auto it = find(id);
        if (it == entities_.end()) return std::nullopt;
        return *it;
    }

    /**
     * Replace the entity with this id. Unknown ids are ignored; returns
     * whether anything was replaced.
     */
    bool queue_update(const std::string& id, Entity entity) {
        auto it = find(id);
        if (it == entities_.end()) {
            qCDebug(neetingsQueueLog) << "update for unknown id" << id.c_str() << "ignored";
            return false;
        }
        *it = std::move(entity);
        mark_pending(id);
        schedule_write();
        return true;
    }

    void queue_add(Entity entity) {
        mark_pending(entity.id);
        entities_.push_back(std::move(entity));
        schedule_write();
    }

    bool queue_remove(const std::string& id) {
        auto it = find(id);
        if (it == entities_.end()) {
            return false;
        }
        entities_.erase(it);
        mark_pending(id);
        schedule_write();
        return true;
    }

    /**
     * Bulk replace (import). Written immediately, no debounce.
     */
    [[nodiscard]] Result<void, Error> set_all(std::vector<Entity> entities) {
        cancel_timer();
        entities_ = std::move(entities);
        for (const auto& entity : entities_) {
            mark_pending(entity.id);
        }
        return write_now();
    }

    /**
     * Cancel any pending timer and write the current collection now.
     */
    [[nodiscard]] Result<void, Error> flush_all() {
        cancel_timer();
        return write_now();
    }

    /**
     * The document holds the whole collection, so this is flush_all().
     */
    [[nodiscard]] Result<void, Error> flush(const std::string& id) {
        qCDebug(neetingsQueueLog) << "flush requested for" << id.c_str();
        return flush_all();
    }

    /**
     * Empty memory and remove the stored document.
     */
    [[nodiscard]] Result<void, Error> clear_all() {
        cancel_timer();
        entities_.clear();
        auto removed = store_.remove(options_.storage_key);
        if (removed.is_err()) {
            report_failure(removed.unwrap_err());
            return removed;
        }
        pending_ids_.clear();
        qCInfo(neetingsQueueLog) << "cleared" << options_.storage_key.c_str();
        return removed;
    }

    /**
     * Cancel any pending timer without writing.
     */
    void destroy() noexcept {
        cancel_timer();
    }

    [[nodiscard]] bool has_pending_updates() const {
        return (task_ && task_->pending()) || !pending_ids_.empty();
    }

    [[nodiscard]] bool write_scheduled() const {
        return task_ && task_->pending();
    }

    [[nodiscard]] std::vector<std::string> pending_ids() const {
        return {pending_ids_.begin(), pending_ids_.end()};
    }

    void set_write_failure_handler(WriteFailureHandler handler) {
        on_write_failure_ = std::move(handler);
    }

    [[nodiscard]] std::chrono::milliseconds delay() const noexcept { return options_.delay; }
    [[nodiscard]] const std::string& storage_key() const noexcept { return options_.storage_key; }

private:
    using Iterator = typename std::vector<Entity>::iterator;
    using ConstIterator = typename std::vector<Entity>::const_iterator;

    Iterator find(const std::string& id) {
        return std::find_if(entities_.begin(), entities_.end(),
                            [&](const Entity& e) { return e.id == id; });
    }

    ConstIterator find(const std::string& id) const {
        return std::find_if(entities_.begin(), entities_.end(),
                            [&](const Entity& e) { return e.id == id; });
    }

    void mark_pending(const std::string& id) {
        pending_ids_.insert(id);
    }

    void schedule_write() {
        // The previous handle may be the one whose callback is running (a
        // failure handler that re-queues), so it is parked until the next
        // schedule instead of being destroyed here.
        cancel_timer();
        retired_task_ = std::move(task_);
        task_ = scheduler_.schedule_after(options_.delay, [this]() {
            auto result = write_now();
            static_cast<void>(result);  // reported through the failure handler
        });
    }

    void cancel_timer() noexcept {
        if (task_) {
            task_->cancel();
        }
    }

    Result<void, Error> write_now() {
        std::string document;
        try {
            document = encode_(entities_);
        } catch (const std::exception& e) {
            Error error{std::string("encode failed: ") + e.what(), errc::write_failed};
            report_failure(error);
            return Result<void, Error>::err(std::move(error));
        }

        auto written = store_.set(options_.storage_key, document);
        if (written.is_err()) {
            report_failure(written.unwrap_err());
            return written;
        }

        qCDebug(neetingsQueueLog) << "wrote" << options_.storage_key.c_str() << "with"
                                  << entities_.size() << "entities";
        pending_ids_.clear();
        return written;
    }

    void report_failure(const Error& error) {
        qCWarning(neetingsQueueLog) << "write of" << options_.storage_key.c_str() << "failed:"
                                    << error.message.c_str() << "- keeping in-memory state";
        if (on_write_failure_) {
            on_write_failure_(error);
        }
    }

    storage::DurableStore& store_;
    Scheduler& scheduler_;
    Encoder encode_;
    Options options_;

    std::vector<Entity> entities_;
    std::set<std::string> pending_ids_;
    std::unique_ptr<ScheduledTask> task_;
    std::unique_ptr<ScheduledTask> retired_task_;
    WriteFailureHandler on_write_failure_;
};

using MeetingUpdateQueue = UpdateQueue<Meeting>;
using AttendeeUpdateQueue = UpdateQueue<Attendee>;

} // namespace neetings::session

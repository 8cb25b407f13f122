#pragma once

#include "core/result.hpp"

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace neetings::storage {

/**
 * DurableStore - string-keyed storage for whole serialized documents.
 *
 * A set() replaces the stored value atomically: readers see either the
 * previous document or the new one, never a mix.
 */
class DurableStore {
public:
    virtual ~DurableStore() = default;

    /**
     * The stored value, or nullopt if nothing is stored under key.
     */
    [[nodiscard]] virtual Result<std::optional<std::string>, Error> get(const std::string& key) = 0;

    [[nodiscard]] virtual Result<void, Error> set(const std::string& key, const std::string& value) = 0;

    /**
     * Remove the value under key. Removing a missing key succeeds.
     */
    [[nodiscard]] virtual Result<void, Error> remove(const std::string& key) = 0;
};

/**
 * MemoryStore - in-process DurableStore. Counts writes and can be told to
 * fail them, which the tests use to observe debouncing and error paths.
 */
class MemoryStore final : public DurableStore {
public:
    [[nodiscard]] Result<std::optional<std::string>, Error> get(const std::string& key) override {
        auto it = values_.find(key);
        if (it == values_.end()) {
            return Result<std::optional<std::string>, Error>::ok(std::nullopt);
        }
        return Result<std::optional<std::string>, Error>::ok(it->second);
    }

    [[nodiscard]] Result<void, Error> set(const std::string& key, const std::string& value) override {
        if (fail_writes_) {
            return Result<void, Error>::err(Error{"MemoryStore: write rejected", errc::write_failed});
        }
        values_[key] = value;
        ++write_count_;
        return Result<void, Error>::ok();
    }

    [[nodiscard]] Result<void, Error> remove(const std::string& key) override {
        if (fail_writes_) {
            return Result<void, Error>::err(Error{"MemoryStore: remove rejected", errc::write_failed});
        }
        values_.erase(key);
        ++remove_count_;
        return Result<void, Error>::ok();
    }

    void set_fail_writes(bool fail) noexcept { fail_writes_ = fail; }

    [[nodiscard]] std::size_t write_count() const noexcept { return write_count_; }
    [[nodiscard]] std::size_t remove_count() const noexcept { return remove_count_; }
    [[nodiscard]] bool contains(const std::string& key) const { return values_.count(key) > 0; }

private:
    std::map<std::string, std::string> values_;
    std::size_t write_count_ = 0;
    std::size_t remove_count_ = 0;
    bool fail_writes_ = false;
};

} // namespace neetings::storage

#pragma once

#include "core/result.hpp"

#include <compare>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace neetings {

/**
 * SortKey - an order key for an item within its group.
 *
 * Keys are strings over the base-62 alphabet 0-9A-Za-z. The alphabet is in
 * ASCII order, so plain byte-wise comparison gives the intended order. A key
 * reads as the fraction 0.d1d2d3..., which means a key that is a prefix of
 * another sorts first ("a" < "aa" < "b").
 *
 * New keys are computed from their neighbours only, so inserting an item
 * never rewrites a sibling's key. Generated keys never end in '0'; such keys
 * are accepted as input but leave no room in front of them at the same
 * precision.
 *
 * A default-constructed SortKey is empty and stands for an open bound
 * ("no neighbour on this side").
 */
class SortKey {
public:
    static constexpr std::string_view DIGITS =
        "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";
    static constexpr int BASE = 62;
    static constexpr char MID_DIGIT = 'V';
    static constexpr std::size_t DEFAULT_MAX_LENGTH = 128;

    SortKey() = default;

    /**
     * Wrap an existing key. Throws std::invalid_argument if the string is
     * empty or contains characters outside the alphabet.
     */
    explicit SortKey(std::string value);

    /**
     * Validating constructor for untrusted input (e.g. a persisted
     * document). Never throws.
     */
    [[nodiscard]] static Result<SortKey> parse(std::string_view value);

    [[nodiscard]] static bool is_valid(std::string_view value) noexcept;

    /**
     * The key for the first item of an empty group.
     */
    [[nodiscard]] static SortKey first() { return SortKey(std::string(1, MID_DIGIT)); }

    /**
     * A key strictly between lo and hi. Either bound may be empty (open).
     * Throws std::invalid_argument if both are set and lo >= hi, and
     * std::length_error if the neighbours leave no room at all (see
     * between_bounded for the non-throwing form).
     */
    [[nodiscard]] static SortKey between(const SortKey& lo, const SortKey& hi);

    /**
     * Like between(), but returns nullopt instead of a key longer than
     * max_length or when no key fits between the neighbours. This is the
     * key-exhaustion signal used by the positioning layer.
     */
    [[nodiscard]] static std::optional<SortKey> between_bounded(
        const SortKey& lo, const SortKey& hi, std::size_t max_length);

    /**
     * count ascending keys strictly between lo and hi, each at most
     * max_length digits, or nullopt if they do not fit.
     */
    [[nodiscard]] static std::optional<std::vector<SortKey>> spread(
        const SortKey& lo, const SortKey& hi, std::size_t count, std::size_t max_length);

    /**
     * A key sorting strictly before / after this one with nothing assumed
     * about other neighbours.
     */
    [[nodiscard]] SortKey before() const { return between(SortKey{}, *this); }
    [[nodiscard]] SortKey after() const { return between(*this, SortKey{}); }

    [[nodiscard]] const std::string& value() const noexcept { return value_; }
    [[nodiscard]] bool is_empty() const noexcept { return value_.empty(); }
    [[nodiscard]] std::size_t length() const noexcept { return value_.size(); }

    auto operator<=>(const SortKey&) const = default;
    bool operator==(const SortKey&) const = default;

private:
    struct Unchecked {};
    SortKey(std::string value, Unchecked) : value_(std::move(value)) {}

    std::string value_;
};

/**
 * Key generation with optional neighbours, mirroring how callers think
 * about insertion: "after this one", "before that one", "between both", or
 * "the first key of a new group". Throws std::invalid_argument for
 * malformed or misordered input.
 */
[[nodiscard]] std::string generate_key(std::optional<std::string_view> preceding = std::nullopt,
                                       std::optional<std::string_view> following = std::nullopt);

} // namespace neetings

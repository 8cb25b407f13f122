#include "core/sort_key.hpp"

#include <limits>
#include <stdexcept>

namespace neetings {

static_assert(SortKey::DIGITS.size() == SortKey::BASE, "Alphabet must have BASE digits");
static_assert(SortKey::DIGITS[SortKey::BASE / 2] == SortKey::MID_DIGIT, "MID_DIGIT must be the middle digit");

namespace {

int digit_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'A' && c <= 'Z') return c - 'A' + 10;
    if (c >= 'a' && c <= 'z') return c - 'a' + 36;
    return -1;
}

char digit_char(int value) {
    return SortKey::DIGITS[static_cast<std::size_t>(value)];
}

// Key strictly between lo and hi, where an empty hi is the upper bound 1.0.
// Requires lo < hi. Returns nullopt when the two are equal as fractions
// ("a" vs "a00"): nothing without a trailing '0' fits between them.
std::optional<std::string> midpoint(std::string_view lo, std::string_view hi) {
    std::string out;
    while (true) {
        // Shared prefix, reading lo as padded with '0'.
        std::size_t n = 0;
        while (n < hi.size()) {
            const char lc = n < lo.size() ? lo[n] : '0';
            if (lc != hi[n]) break;
            ++n;
        }
        if (!hi.empty() && n == hi.size()) {
            return std::nullopt;
        }

        out.append(hi.substr(0, n));
        lo = n < lo.size() ? lo.substr(n) : std::string_view{};
        hi = hi.substr(n);

        const int dl = lo.empty() ? 0 : digit_value(lo.front());
        const int dh = hi.empty() ? SortKey::BASE : digit_value(hi.front());

        if (dh - dl > 1) {
            out.push_back(digit_char((dl + dh) / 2));
            return out;
        }

        // Adjacent digits at this position.
        if (hi.size() > 1) {
            out.push_back(hi.front());
            return out;
        }
        out.push_back(digit_char(dl));
        lo = lo.empty() ? lo : lo.substr(1);
        hi = {};
    }
}

// Shortest key after lo: bump the first digit that is not already 'z'.
std::optional<std::string> increment(std::string_view lo) {
    for (std::size_t i = 0; i < lo.size(); ++i) {
        const int d = digit_value(lo[i]);
        if (d < SortKey::BASE - 1) {
            std::string out(lo.substr(0, i));
            out.push_back(digit_char(d + 1));
            return out;
        }
    }
    return midpoint(lo, {});
}

// Shortest key before hi: lower the first digit that can drop without
// leaving a trailing '0'.
std::optional<std::string> decrement(std::string_view hi) {
    for (std::size_t i = 0; i < hi.size(); ++i) {
        const int d = digit_value(hi[i]);
        if (d > 1) {
            std::string out(hi.substr(0, i));
            out.push_back(digit_char(d - 1));
            return out;
        }
    }
    return midpoint({}, hi);
}

} // namespace

SortKey::SortKey(std::string value) : value_(std::move(value)) {
    if (!is_valid(value_)) {
        throw std::invalid_argument("Invalid sort key: \"" + value_ + "\"");
    }
}

Result<SortKey> SortKey::parse(std::string_view value) {
    if (!is_valid(value)) {
        return Result<SortKey>::err(
            Error{"Invalid sort key: \"" + std::string(value) + "\"", errc::decode_failed});
    }
    return Result<SortKey>::ok(SortKey(std::string(value), Unchecked{}));
}

bool SortKey::is_valid(std::string_view value) noexcept {
    if (value.empty()) return false;
    for (char c : value) {
        if (digit_value(c) < 0) return false;
    }
    return true;
}

std::optional<SortKey> SortKey::between_bounded(
    const SortKey& lo, const SortKey& hi, std::size_t max_length
) {
    if (!lo.is_empty() && !hi.is_empty() && lo >= hi) {
        throw std::invalid_argument(
            "Invalid key order: \"" + lo.value_ + "\" should be < \"" + hi.value_ + "\"");
    }

    std::optional<std::string> key;
    if (lo.is_empty() && hi.is_empty()) {
        key = std::string(1, MID_DIGIT);
    } else if (lo.is_empty()) {
        key = decrement(hi.value_);
    } else if (hi.is_empty()) {
        key = increment(lo.value_);
    } else {
        key = midpoint(lo.value_, hi.value_);
    }

    if (!key || key->size() > max_length) {
        return std::nullopt;
    }
    return SortKey(std::move(*key), Unchecked{});
}

SortKey SortKey::between(const SortKey& lo, const SortKey& hi) {
    auto key = between_bounded(lo, hi, std::numeric_limits<std::size_t>::max());
    if (!key) {
        throw std::length_error(
            "No sort key fits between \"" + lo.value_ + "\" and \"" + hi.value_ + "\"");
    }
    return std::move(*key);
}

std::optional<std::vector<SortKey>> SortKey::spread(
    const SortKey& lo, const SortKey& hi, std::size_t count, std::size_t max_length
) {
    std::vector<SortKey> keys;
    if (count == 0) {
        return keys;
    }

    // Bisect so key lengths grow with log(count) rather than count.
    auto mid = between_bounded(lo, hi, max_length);
    if (!mid) {
        return std::nullopt;
    }
    const auto left_count = (count - 1) / 2;
    auto left = spread(lo, *mid, left_count, max_length);
    if (!left) {
        return std::nullopt;
    }
    auto right = spread(*mid, hi, count - 1 - left_count, max_length);
    if (!right) {
        return std::nullopt;
    }

    keys.reserve(count);
    keys.insert(keys.end(), left->begin(), left->end());
    keys.push_back(std::move(*mid));
    keys.insert(keys.end(), right->begin(), right->end());
    return keys;
}

std::string generate_key(std::optional<std::string_view> preceding,
                         std::optional<std::string_view> following) {
    const SortKey lo = preceding ? SortKey(std::string(*preceding)) : SortKey{};
    const SortKey hi = following ? SortKey(std::string(*following)) : SortKey{};
    return SortKey::between(lo, hi).value();
}

} // namespace neetings

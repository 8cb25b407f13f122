#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/positioning.hpp"
#include "core/sort_key.hpp"

#include <algorithm>
#include <set>
#include <string>
#include <vector>

using namespace neetings;

namespace rc {

// Keys the engine could have produced: non-empty, no trailing '0'.
template<>
struct Arbitrary<SortKey> {
    static Gen<SortKey> arbitrary() {
        return gen::map(
            gen::container<std::string>(gen::elementOf(std::string(SortKey::DIGITS))),
            [](std::string s) {
                while (!s.empty() && s.back() == '0') s.pop_back();
                if (s.empty()) return SortKey::first();
                return SortKey(s);
            }
        );
    }
};

} // namespace rc

TEST_CASE("Property: between is strictly ordered", "[property][sort_key]") {
    REQUIRE(rc::check("a < between(a, b) < b",
        [](const SortKey& a, const SortKey& b) {
            RC_PRE(a < b);

            const auto middle = SortKey::between(a, b);
            RC_ASSERT(a < middle);
            RC_ASSERT(middle < b);
            RC_ASSERT(middle.value().back() != '0');
        }));
}

TEST_CASE("Property: before and after bracket the key", "[property][sort_key]") {
    REQUIRE(rc::check("key.before() < key < key.after()",
        [](const SortKey& key) {
            const auto before = key.before();
            const auto after = key.after();
            RC_ASSERT(before < key);
            RC_ASSERT(key < after);
            RC_ASSERT(before.value().back() != '0');
            RC_ASSERT(after.value().back() != '0');
        }));
}

TEST_CASE("Property: insertions never disturb siblings", "[property][positioning]") {
    REQUIRE(rc::check("placing at any gap keeps every existing key",
        [](const std::vector<unsigned>& gaps) {
            std::vector<blocks::Block> column;
            std::set<std::string> seen;

            for (std::size_t i = 0; i < gaps.size(); ++i) {
                const auto gap = gaps[i] % (column.size() + 1);
                auto placement = ordering::place_at(column, gap);
                RC_ASSERT(placement.renumbered.empty());
                RC_ASSERT(seen.insert(placement.key.value()).second);

                blocks::Block block;
                block.id = std::to_string(i);
                block.sort_key = placement.key;
                column.insert(column.begin() + static_cast<long>(gap), std::move(block));
            }

            RC_ASSERT(std::is_sorted(column.begin(), column.end(),
                [](const blocks::Block& a, const blocks::Block& b) {
                    return a.sort_key < b.sort_key;
                }));
        }));
}

TEST_CASE("Property: spread fits count keys between bounds", "[property][sort_key]") {
    REQUIRE(rc::check("spread(lo, hi, n) is ascending and inside (lo, hi)",
        [](const SortKey& lo, const SortKey& hi) {
            RC_PRE(lo < hi);
            const auto count = *rc::gen::inRange<std::size_t>(1, 50);

            const auto keys = SortKey::spread(lo, hi, count, SortKey::DEFAULT_MAX_LENGTH);
            RC_PRE(keys.has_value());
            RC_ASSERT(keys->size() == count);
            RC_ASSERT(lo < keys->front());
            RC_ASSERT(keys->back() < hi);
            RC_ASSERT(std::adjacent_find(keys->begin(), keys->end(),
                [](const SortKey& a, const SortKey& b) { return !(a < b); }) == keys->end());
        }));
}

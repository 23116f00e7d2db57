#include "utils.hpp"

#include <set>

namespace apiguard::test {

    namespace {
        std::set<std::string> as_set(const std::vector<std::string>& ids) {
            return {ids.begin(), ids.end()};
        }
    }  // namespace

    TEST_CASE("004: diff classifies added, removed and changed", "[004][diff]") {
        auto old_snap = detail::make_snapshot(
                "Core", {{"s:keep", "func keep()"}, {"s:gone", "func gone()"}, {"s:sig", "func sig()"}});
        auto new_snap = detail::make_snapshot(
                "Core", {{"s:keep", "func keep()"}, {"s:sig", "func sig(x: Int)"}, {"s:new", "func new()"}});

        auto d = diff(old_snap, new_snap);
        CHECK(d.target == "Core");
        CHECK(d.added == std::vector<std::string>{"s:new"});
        CHECK(d.removed == std::vector<std::string>{"s:gone"});
        CHECK(d.changed == std::vector<std::string>{"s:sig"});
        CHECK(d.has_breaking());
        CHECK(d.has_additions());
        CHECK_FALSE(d.empty());
    }

    TEST_CASE("004: diff output is sorted by identifier", "[004][diff]") {
        auto old_snap = detail::make_snapshot(
                "Core", {{"s:z", "1"}, {"s:m", "1"}, {"s:a", "1"}, {"s:y", "1"}, {"s:b", "1"}, {"s:c", "1"}});
        auto new_snap = detail::make_snapshot(
                "Core", {{"s:y", "2"}, {"s:b", "2"}, {"s:q", "1"}, {"s:d", "1"}, {"s:p", "1"}, {"s:c", "2"}});

        auto d = diff(old_snap, new_snap);
        CHECK(d.added == std::vector<std::string>{"s:d", "s:p", "s:q"});
        CHECK(d.removed == std::vector<std::string>{"s:a", "s:m", "s:z"});
        CHECK(d.changed == std::vector<std::string>{"s:b", "s:c", "s:y"});
    }

    TEST_CASE("004: diff of a snapshot with itself is empty", "[004][diff]") {
        auto snap = detail::make_snapshot("Core", {{"s:a", "func a()"}, {"s:b", "func b()"}});
        auto d = diff(snap, snap);
        CHECK(d.empty());
        CHECK_FALSE(d.has_breaking());
        CHECK_FALSE(d.has_additions());

        auto empty = detail::make_snapshot("Core", {});
        CHECK(diff(empty, empty).empty());
    }

    TEST_CASE("004: added one way is removed the other way", "[004][diff]") {
        auto a = detail::make_snapshot("Core", {{"s:1", "a"}, {"s:2", "b"}, {"s:3", "c"}});
        auto b = detail::make_snapshot("Core", {{"s:2", "b"}, {"s:3", "changed"}, {"s:4", "d"}, {"s:5", "e"}});

        auto ab = diff(a, b);
        auto ba = diff(b, a);
        CHECK(as_set(ab.added) == as_set(ba.removed));
        CHECK(as_set(ab.removed) == as_set(ba.added));
        CHECK(as_set(ab.changed) == as_set(ba.changed));
    }

    TEST_CASE("004: timestamps do not participate in the diff", "[004][diff]") {
        auto a = detail::make_snapshot("Core", {{"s:1", "a"}});
        auto b = a;
        b.created_at = "2030-12-31T23:59:59Z";
        CHECK(diff(a, b).empty());
    }

    TEST_CASE("004: signature comparison is byte-exact", "[004][diff]") {
        auto a = detail::make_snapshot("Core", {{"s:1", "func f()"}});
        auto b = detail::make_snapshot("Core", {{"s:1", "func  f()"}});
        CHECK(diff(a, b).changed == std::vector<std::string>{"s:1"});
    }

}  // namespace apiguard::test

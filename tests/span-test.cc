#include "assert-capture.hh"

#include <ordered-core/span.hh>

#include <nexus/test.hh>

#include <string>
#include <type_traits>

static_assert(std::is_trivially_copyable_v<oc::span<int>>);
static_assert(std::is_trivially_copyable_v<oc::span<std::string>>);
static_assert(std::is_convertible_v<oc::span<int>, oc::span<int const>>);
static_assert(!std::is_convertible_v<oc::span<int const>, oc::span<int>>);

namespace
{
int sum(oc::span<int const> values)
{
    int s = 0;
    for (auto v : values)
        s += v;
    return s;
}
} // namespace

TEST("span - construction")
{
    SECTION("default is empty")
    {
        oc::span<int> s;
        CHECK(s.empty());
        CHECK(s.size() == 0);
        CHECK(s.data() == nullptr);
        CHECK(s.begin() == s.end());
    }

    SECTION("pointer and size")
    {
        int values[] = {1, 2, 3};
        auto s = oc::span<int>(values, 3);
        CHECK(s.size() == 3);
        CHECK(s.data() == values);
    }

    SECTION("pointer range")
    {
        int values[] = {1, 2, 3, 4};
        auto s = oc::span<int>(values + 1, values + 4);
        CHECK(s.size() == 3);
        CHECK(s.front() == 2);
        CHECK(s.back() == 4);
    }
}

TEST("span - element access writes through")
{
    int values[] = {1, 2, 3};
    auto s = oc::span<int>(values, 3);

    s[1] = 20;
    CHECK(values[1] == 20);

    s.front() = 10;
    s.back() = 30;
    CHECK(values[0] == 10);
    CHECK(values[2] == 30);
    CHECK(sum(s) == 60);
}

TEST("span - drop_front")
{
    std::string keys[] = {"a", "b", "c"};
    auto s = oc::span<std::string const>(keys, 3);

    auto rest = s.drop_front(1);
    REQUIRE(rest.size() == 2);
    CHECK(rest[0] == "b");
    CHECK(rest[1] == "c");

    CHECK(s.drop_front(0).size() == 3);
    CHECK(s.drop_front(3).empty());
}

TEST("span - precondition violations assert")
{
    if constexpr (!OC_ASSERT_ENABLED)
        return;

    int values[] = {1, 2, 3};
    auto s = oc::span<int>(values, 3);
    auto empty = oc::span<int>();

    CHECK(oc_test::asserts([&] { (void)s[3]; }));
    CHECK(oc_test::asserts([&] { (void)s[-1]; }));
    CHECK(oc_test::asserts([&] { (void)empty.front(); }));
    CHECK(oc_test::asserts([&] { (void)empty.back(); }));
    CHECK(oc_test::asserts([&] { (void)s.drop_front(4); }));
    CHECK(!oc_test::asserts([&] { (void)s[2]; }));
}

#include "assert-capture.hh"

#include <ordered-core/span.hh>
#include <ordered-core/vector.hh>

#include <nexus/test.hh>

#include <string>
#include <vector>

namespace
{
// instance bookkeeping to verify construction/destruction balance
struct tracked
{
    int value = 0;
    static inline int alive = 0;
    static inline int copies = 0;

    static void reset()
    {
        alive = 0;
        copies = 0;
    }

    explicit tracked(int v) : value(v) { ++alive; }
    tracked(tracked const& rhs) : value(rhs.value)
    {
        ++alive;
        ++copies;
    }
    tracked(tracked&& rhs) noexcept : value(rhs.value) { ++alive; }
    tracked& operator=(tracked const& rhs)
    {
        value = rhs.value;
        ++copies;
        return *this;
    }
    tracked& operator=(tracked&& rhs) noexcept
    {
        value = rhs.value;
        return *this;
    }
    ~tracked() { --alive; }
};

// move constructor throws once `moves_left` reaches zero
struct fragile
{
    int value = 0;
    static inline int alive = 0;
    static inline int moves_left = 1 << 30;

    explicit fragile(int v) : value(v) { ++alive; }
    fragile(fragile const& rhs) : value(rhs.value) { ++alive; }
    fragile(fragile&& rhs) : value(rhs.value)
    {
        if (moves_left-- == 0)
            throw 1;
        ++alive;
    }
    fragile& operator=(fragile const&) = default;
    ~fragile() { --alive; }
};

struct counting_resource : oc::memory_resource
{
    int allocations = 0;
    int deallocations = 0;

    counting_resource()
    {
        userdata = this;
        allocate_bytes = [](oc::byte** out_ptr, oc::isize min_bytes, oc::isize max_bytes, oc::isize alignment,
                            void* ud) -> oc::isize
        {
            auto const& sys = *oc::default_memory_resource;
            auto const n = sys.allocate_bytes(out_ptr, min_bytes, max_bytes, alignment, sys.userdata);
            if (n > 0)
                ++static_cast<counting_resource*>(ud)->allocations;
            return n;
        };
        deallocate_bytes = [](oc::byte* p, oc::isize bytes, oc::isize alignment, void* ud)
        {
            ++static_cast<counting_resource*>(ud)->deallocations;
            auto const& sys = *oc::default_memory_resource;
            sys.deallocate_bytes(p, bytes, alignment, sys.userdata);
        };
    }
};
} // namespace

TEST("vector - empty")
{
    oc::vector<int> v;
    CHECK(v.empty());
    CHECK(v.size() == 0);
    CHECK(v.capacity() == 0);
    CHECK(v.begin() == v.end());
    CHECK(v.as_span().empty());
}

TEST("vector - push_back keeps order across growth")
{
    oc::vector<int> v;
    for (int i = 0; i < 1000; ++i)
        v.push_back(i);

    REQUIRE(v.size() == 1000);
    CHECK(v.capacity() >= 1000);
    CHECK(v.front() == 0);
    CHECK(v.back() == 999);

    bool in_order = true;
    for (int i = 0; i < 1000; ++i)
        in_order = in_order && v[i] == i;
    CHECK(in_order);
}

TEST("vector - growth is geometric")
{
    counting_resource res;
    {
        auto v = oc::vector<oc::u64>::create_with_capacity(0, &res);
        for (int i = 0; i < 10'000; ++i)
            v.push_back(oc::u64(i));
        CHECK(res.allocations < 20);
    }
    CHECK(res.allocations == res.deallocations);
}

TEST("vector - emplace_back may reference own elements")
{
    oc::vector<std::string> v;
    v.push_back("a long string that certainly lives on the heap");

    // force several reallocations while copying the first element
    for (int i = 0; i < 100; ++i)
        v.push_back(v[0]);

    CHECK(v.size() == 101);
    CHECK(v.back() == v.front());
}

TEST("vector - element lifetimes")
{
    tracked::reset();

    SECTION("destruction")
    {
        {
            oc::vector<tracked> v;
            for (int i = 0; i < 50; ++i)
                v.emplace_back(i);
            CHECK(tracked::alive == 50);
        }
        CHECK(tracked::alive == 0);
    }

    SECTION("clear keeps capacity")
    {
        oc::vector<tracked> v;
        for (int i = 0; i < 10; ++i)
            v.emplace_back(i);
        auto const cap = v.capacity();
        v.clear();
        CHECK(v.empty());
        CHECK(v.capacity() == cap);
        CHECK(tracked::alive == 0);
    }

    SECTION("growth moves, does not copy")
    {
        oc::vector<tracked> v;
        for (int i = 0; i < 100; ++i)
            v.emplace_back(i);
        CHECK(tracked::copies == 0);
    }
}

TEST("vector - throwing move during growth leaks nothing")
{
    fragile::alive = 0;
    fragile::moves_left = 1 << 30;

    counting_resource res;
    {
        auto v = oc::vector<fragile>::create_with_capacity(0, &res);
        v.emplace_back(0);
        while (v.size() < v.capacity())
            v.emplace_back(int(v.size()));
        REQUIRE(v.size() >= 3);

        auto const size_before = v.size();
        fragile::moves_left = 2;

        bool thrown = false;
        try
        {
            v.emplace_back(-1);
        }
        catch (int)
        {
            thrown = true;
        }
        fragile::moves_left = 1 << 30;

        CHECK(thrown);
        CHECK(v.size() == size_before);
        CHECK(fragile::alive == size_before);
        for (oc::isize i = 0; i < v.size(); ++i)
            CHECK(v[i].value == i);
    }
    CHECK(fragile::alive == 0);
    CHECK(res.allocations == res.deallocations);
}

TEST("vector - removal")
{
    oc::vector<int> v;
    for (int i = 0; i < 5; ++i)
        v.push_back(i); // 0 1 2 3 4

    SECTION("remove_at_unordered moves the last element into the gap")
    {
        v.remove_at_unordered(1);
        REQUIRE(v.size() == 4);
        CHECK(v[0] == 0);
        CHECK(v[1] == 4);
        CHECK(v[3] == 3);
    }

    SECTION("remove_at_unordered on the last element")
    {
        v.remove_at_unordered(4);
        CHECK(v.size() == 4);
        CHECK(v.back() == 3);
    }

    SECTION("pop_at_unordered returns the element")
    {
        CHECK(v.pop_at_unordered(2) == 2);
        CHECK(v[2] == 4);
    }

    SECTION("pop_back and remove_back")
    {
        CHECK(v.pop_back() == 4);
        v.remove_back();
        CHECK(v.size() == 3);
        CHECK(v.back() == 2);
    }
}

TEST("vector - reserve")
{
    counting_resource res;
    auto v = oc::vector<int>::create_with_capacity(0, &res);
    v.reserve(100);
    CHECK(v.capacity() >= 100);

    auto const allocations = res.allocations;
    auto const* data = v.data();
    for (int i = 0; i < 100; ++i)
        v.push_back(i);
    CHECK(res.allocations == allocations);
    CHECK(v.data() == data);

    // never shrinks
    v.reserve(1);
    CHECK(v.capacity() >= 100);
}

TEST("vector - factories")
{
    auto filled = oc::vector<std::string>::create_filled(3, "x");
    REQUIRE(filled.size() == 3);
    CHECK(filled[2] == "x");

    int const src[] = {3, 1, 2};
    auto copied = oc::vector<int>::create_copy_of(oc::span<int const>(src, 3));
    REQUIRE(copied.size() == 3);
    CHECK(copied[0] == 3);
    CHECK(copied[2] == 2);
}

TEST("vector - value semantics")
{
    oc::vector<std::string> a;
    a.push_back("name");
    a.push_back("kumarmo2");

    SECTION("copy is deep")
    {
        auto b = a;
        b[0] = "changed";
        CHECK(a[0] == "name");
        CHECK(b.size() == 2);
        CHECK(a != b);
    }

    SECTION("copy assignment")
    {
        oc::vector<std::string> b;
        b.push_back("old");
        b = a;
        CHECK(b == a);
    }

    SECTION("move leaves source empty")
    {
        auto b = oc::move(a);
        CHECK(a.empty()); // NOLINT(bugprone-use-after-move)
        CHECK(b.size() == 2);
        CHECK(b[1] == "kumarmo2");
    }

    SECTION("copy keeps the source resource")
    {
        counting_resource res;
        auto c = oc::vector<int>::create_with_capacity(4, &res);
        c.push_back(1);
        auto d = c;
        CHECK(d.resource() == &res);
        CHECK(res.allocations == 2);
    }
}

TEST("vector - out of bounds asserts")
{
    if constexpr (!OC_ASSERT_ENABLED)
        return;

    oc::vector<int> v;
    v.push_back(1);

    CHECK(oc_test::asserts([&] { (void)v[1]; }));
    CHECK(oc_test::asserts([&] { v.remove_at_unordered(5); }));

    oc::vector<int> empty;
    CHECK(oc_test::asserts([&] { (void)empty.front(); }));
    CHECK(oc_test::asserts([&] { empty.remove_back(); }));
}

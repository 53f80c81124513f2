#include "assert-capture.hh"

#include <ordered-core/allocation.hh>

#include <nexus/test.hh>

#include <string>

namespace
{
// forwards to the default resource and counts calls
struct counting_resource : oc::memory_resource
{
    int allocations = 0;
    int deallocations = 0;
    oc::isize live_bytes = 0;

    counting_resource()
    {
        userdata = this;
        allocate_bytes = [](oc::byte** out_ptr, oc::isize min_bytes, oc::isize max_bytes, oc::isize alignment,
                            void* ud) -> oc::isize
        {
            auto& self = *static_cast<counting_resource*>(ud);
            auto const& sys = *oc::default_memory_resource;
            auto const n = sys.allocate_bytes(out_ptr, min_bytes, max_bytes, alignment, sys.userdata);
            if (n > 0)
            {
                ++self.allocations;
                self.live_bytes += n;
            }
            return n;
        };
        deallocate_bytes = [](oc::byte* p, oc::isize bytes, oc::isize alignment, void* ud)
        {
            auto& self = *static_cast<counting_resource*>(ud);
            ++self.deallocations;
            self.live_bytes -= bytes;
            auto const& sys = *oc::default_memory_resource;
            sys.deallocate_bytes(p, bytes, alignment, sys.userdata);
        };
    }
};
} // namespace

TEST("allocation - default state is empty and valid to destroy")
{
    oc::allocation<int> a;
    CHECK(!a.is_valid());
    CHECK(a.obj_count() == 0);
    CHECK(a.alloc_size_bytes() == 0);
    CHECK(&a.resource() == oc::default_memory_resource);
}

TEST("allocation - create_empty_bytes")
{
    SECTION("default resource")
    {
        auto a = oc::allocation<oc::u64>::create_empty_bytes(256, 256, 64, nullptr);
        CHECK(a.is_valid());
        CHECK(a.alloc_size_bytes() == 256);
        CHECK(a.obj_count() == 0);
        CHECK(a.alignment == 64);
        CHECK((reinterpret_cast<oc::isize>(a.alloc_start) & 63) == 0);
    }

    SECTION("zero bytes does not allocate")
    {
        counting_resource res;
        {
            auto a = oc::allocation<int>::create_empty_bytes(0, 0, alignof(int), &res);
            CHECK(!a.is_valid());
        }
        CHECK(res.allocations == 0);
        CHECK(res.deallocations == 0);
    }
}

TEST("allocation - custom resource sees matching alloc and free")
{
    counting_resource res;
    {
        auto a = oc::allocation<std::string>::create_empty_bytes(128, 128, 64, &res);
        CHECK(&a.resource() == &res);
        CHECK(res.allocations == 1);
        CHECK(res.live_bytes == 128);

        // live objects are destroyed with the allocation
        new (oc::placement_new, a.obj_end) std::string("a rather long string that does not fit into sso");
        ++a.obj_end;
        CHECK(a.obj_count() == 1);
    }
    CHECK(res.deallocations == 1);
    CHECK(res.live_bytes == 0);
}

TEST("allocation - move transfers ownership")
{
    counting_resource res;
    {
        auto a = oc::allocation<int>::create_empty_bytes(64, 64, 64, &res);
        auto* const start = a.alloc_start;

        auto b = oc::move(a);
        CHECK(!a.is_valid()); // NOLINT(bugprone-use-after-move)
        CHECK(b.alloc_start == start);

        oc::allocation<int> c;
        c = oc::move(b);
        CHECK(c.alloc_start == start);
        CHECK(res.allocations == 1);
    }
    CHECK(res.deallocations == 1);
}

TEST("allocation - invalid requests assert")
{
    if constexpr (!OC_ASSERT_ENABLED)
        return;

    CHECK(oc_test::asserts([] { (void)oc::allocation<oc::u64>::create_empty_bytes(64, 64, 4, nullptr); }));
    CHECK(oc_test::asserts([] { (void)oc::allocation<int>::create_empty_bytes(64, 32, 64, nullptr); }));
}

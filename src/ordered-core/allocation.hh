#pragma once

#include <ordered-core/fwd.hh>
#include <ordered-core/impl/object_lifetime_util.hh>
#include <ordered-core/utility.hh>

// Memory layer underneath oc::vector, and through it underneath every part of map and ordered_map.
//
// memory_resource  where bytes come from (plain function pointers, usable during static init)
// allocation<T>    one owned byte block plus the window of live T objects inside it
//
//   alloc_start          obj_start        obj_end               alloc_end
//   |  (unused)          |  live objects  |  (capacity)         |

namespace oc
{
/// Resource used by every allocation whose custom_resource is nullptr.
/// Backed by posix_memalign / _aligned_malloc.
extern memory_resource const* const default_memory_resource;
} // namespace oc

/// Byte source for containers.
/// A POD of function pointers so that resources can be constant-initialized globals.
struct oc::memory_resource
{
    /// Allocates at least min_bytes and at most max_bytes, aligned to `alignment`.
    /// Writes the block to *out_ptr and returns its actual size.
    /// min_bytes == 0 yields nullptr and 0 without allocating.
    /// Running out of memory is not reported back; the resource asserts or throws.
    oc::function_ptr<isize(oc::byte** out_ptr, isize min_bytes, isize max_bytes, isize alignment, void* userdata)> allocate_bytes
        = nullptr;

    /// Frees a block with the size and alignment it was allocated with.
    oc::function_ptr<void(oc::byte* p, isize bytes, isize alignment, void* userdata)> deallocate_bytes = nullptr;

    /// Passed back to both functions, e.g. a pointer to an arena or to test counters.
    void* userdata = nullptr;
};

/// Move-only owner of one block from a memory_resource and of the T objects alive inside it.
///
/// Destruction destroys [obj_start, obj_end) back to front, then returns the block.
/// The owning container moves obj_start / obj_end itself when it constructs or destroys elements.
/// A zero-initialized allocation is empty and bound to the default resource.
template <class T>
struct oc::allocation
{
    T* obj_start = nullptr;
    T* obj_end = nullptr;

    oc::byte* alloc_start = nullptr;
    oc::byte* alloc_end = nullptr;

    /// needed again for deallocation
    isize alignment = 0;

    /// nullptr selects oc::default_memory_resource
    oc::memory_resource const* custom_resource = nullptr;

public:
    [[nodiscard]] oc::memory_resource const& resource() const
    {
        return custom_resource != nullptr ? *custom_resource : *default_memory_resource;
    }

    [[nodiscard]] bool is_valid() const { return alloc_start != nullptr; }
    [[nodiscard]] isize alloc_size_bytes() const { return alloc_end - alloc_start; }
    [[nodiscard]] isize obj_count() const { return obj_end - obj_start; }

    /// A block of [min_bytes, max_bytes] bytes without live objects, the window sits at its start.
    /// `resource` is stored and used again for deallocation.
    [[nodiscard]] static allocation create_empty_bytes(isize min_bytes,
                                                       isize max_bytes,
                                                       isize alignment,
                                                       memory_resource const* resource)
    {
        OC_ASSERT(alignment >= isize(alignof(T)), "alignment below alignof(T)");
        OC_ASSERT(0 <= min_bytes && min_bytes <= max_bytes, "invalid byte range");

        allocation result;
        result.custom_resource = resource;
        result.alignment = alignment;

        auto const& res = result.resource();
        auto const size = res.allocate_bytes(&result.alloc_start, min_bytes, max_bytes, alignment, res.userdata);
        OC_ASSERT(oc::is_aligned(result.alloc_start, alignment), "memory resource ignored the requested alignment");

        result.alloc_end = result.alloc_start + size;
        result.obj_start = reinterpret_cast<T*>(result.alloc_start);
        result.obj_end = result.obj_start;
        return result;
    }

public:
    allocation() = default;

    allocation(allocation const&) = delete;
    allocation& operator=(allocation const&) = delete;

    /// The resource is copied, not reset, so a moved-from container keeps allocating from it.
    allocation(allocation&& rhs) noexcept { take(rhs); }

    /// Safe even if rhs is stored inside one of our own live objects:
    /// rhs is emptied into a local before anything of ours is destroyed.
    allocation& operator=(allocation&& rhs) noexcept
    {
        if (this != &rhs)
        {
            allocation incoming;
            incoming.take(rhs);
            release();
            take(incoming);
        }
        return *this;
    }

    ~allocation() { release(); }

private:
    void take(allocation& rhs) noexcept
    {
        obj_start = oc::exchange(rhs.obj_start, nullptr);
        obj_end = oc::exchange(rhs.obj_end, nullptr);
        alloc_start = oc::exchange(rhs.alloc_start, nullptr);
        alloc_end = oc::exchange(rhs.alloc_end, nullptr);
        alignment = oc::exchange(rhs.alignment, 0);
        custom_resource = rhs.custom_resource;
    }

    void release()
    {
        impl::destroy_objects_in_reverse(obj_start, obj_end);
        obj_end = obj_start;

        if (alloc_start != nullptr)
        {
            auto const& res = resource();
            res.deallocate_bytes(alloc_start, alloc_end - alloc_start, alignment, res.userdata);
            alloc_start = nullptr;
            alloc_end = nullptr;
        }
    }
};

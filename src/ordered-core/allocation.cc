#include "allocation.hh"

#include <ordered-core/assert.hh>
#include <ordered-core/macros.hh>
#include <ordered-core/utility.hh>

#include <cstdlib>

#ifdef OC_OS_WINDOWS
#include <malloc.h>
#endif

namespace
{
// stateless, userdata is ignored
// returns exactly min_bytes, max_bytes only grants leeway we do not use

oc::isize heap_allocate(oc::byte** out_ptr, oc::isize min_bytes, oc::isize max_bytes, oc::isize alignment, void* userdata)
{
    OC_UNUSED(max_bytes);
    OC_UNUSED(userdata);
    OC_ASSERT(alignment > 0 && oc::is_power_of_two(alignment), "alignment must be a power of two");

    *out_ptr = nullptr;
    if (min_bytes == 0)
        return 0;

#ifdef OC_OS_WINDOWS
    *out_ptr = static_cast<oc::byte*>(_aligned_malloc(size_t(min_bytes), size_t(alignment)));
#else
    // posix_memalign rejects alignments below sizeof(void*)
    auto const align = oc::max(alignment, oc::isize(sizeof(void*)));
    void* p = nullptr;
    if (posix_memalign(&p, size_t(align), size_t(min_bytes)) == 0)
        *out_ptr = static_cast<oc::byte*>(p);
#endif

    OC_ASSERT_ALWAYS(*out_ptr != nullptr, "out of memory");
    return min_bytes;
}

void heap_deallocate(oc::byte* p, oc::isize bytes, oc::isize alignment, void* userdata)
{
    OC_UNUSED(bytes);
    OC_UNUSED(alignment);
    OC_UNUSED(userdata);

#ifdef OC_OS_WINDOWS
    _aligned_free(p);
#else
    std::free(p);
#endif
}

constinit oc::memory_resource const heap_resource = {
    .allocate_bytes = heap_allocate,
    .deallocate_bytes = heap_deallocate,
    .userdata = nullptr,
};
} // namespace

constinit oc::memory_resource const* const oc::default_memory_resource = &heap_resource;

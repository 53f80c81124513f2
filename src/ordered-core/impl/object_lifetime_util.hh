#pragma once

#include <ordered-core/fwd.hh>
#include <ordered-core/utility.hh>

#include <cstring>
#include <type_traits>

// Bulk construction and destruction on raw memory, used by allocation<T> and vector<T>.
//
// The *_create_objects_to functions construct at `dest_end` and advance it after every element.
// If a constructor throws, [old dest_end, dest_end) is exactly what was built, so the owner can clean up.
// Trivially copyable element types are copied with a single memcpy.

namespace oc::impl
{
template <class T>
constexpr void destroy_objects_in_reverse(T* first, T* last)
{
    static_assert(sizeof(T) > 0, "T is incomplete here, include its definition");

    if constexpr (!std::is_trivially_destructible_v<T>)
        for (auto p = last; p != first;)
            (--p)->~T();
}

template <class T>
void memcpy_objects_to(T*& dest_end, T const* first, T const* last)
{
    auto const count = last - first;
    if (count == 0)
        return;
    std::memcpy(static_cast<void*>(dest_end), first, count * sizeof(T));
    dest_end += count;
}

/// `count` copies of `value`.
template <class T>
constexpr void fill_create_objects_to(T*& dest_end, isize count, T const& value)
{
    for (isize i = 0; i < count; ++i)
    {
        new (oc::placement_new, dest_end) T(value);
        ++dest_end;
    }
}

template <class T>
constexpr void copy_create_objects_to(T*& dest_end, T const* first, T const* last)
{
    if constexpr (std::is_trivially_copyable_v<T>)
    {
        impl::memcpy_objects_to(dest_end, first, last);
    }
    else
    {
        for (auto p = first; p != last; ++p)
        {
            new (oc::placement_new, dest_end) T(*p);
            ++dest_end;
        }
    }
}

/// The sources are left moved-from; their owner still has to destroy them.
template <class T>
constexpr void move_create_objects_to(T*& dest_end, T* first, T* last)
{
    if constexpr (std::is_trivially_copyable_v<T>)
    {
        impl::memcpy_objects_to(dest_end, static_cast<T const*>(first), static_cast<T const*>(last));
    }
    else
    {
        for (auto p = first; p != last; ++p)
        {
            new (oc::placement_new, dest_end) T(oc::move(*p));
            ++dest_end;
        }
    }
}
} // namespace oc::impl

#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>

#include <type_traits>

// Small building blocks shared by the containers.
//
//   oc::move / oc::forward / oc::exchange    value-category helpers without <utility>
//   oc::max                                  larger of two values
//   oc::is_power_of_two / ceil_power_of_two  bucket table sizing
//   oc::align_up / is_aligned                allocation sizing
//   oc::placement_new, oc::storage_for<T>    manual object lifetime (optional, allocation)
//   oc::function_ptr<Sig>                    readable function pointer types (memory_resource)
//   oc::sentinel                             end() of single-pass ranges (ordered_map)

namespace oc
{
template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr std::remove_reference_t<T>&& move(T&& value) noexcept
{
    return static_cast<std::remove_reference_t<T>&&>(value);
}

template <class T>
[[nodiscard]] OC_FORCE_INLINE constexpr T&& forward(std::remove_reference_t<T>& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Stores new_value in obj and returns what was there before.
/// Usage:
///   optional<V> previous = oc::exchange(row.value, oc::move(value));
template <class T, class U = T>
[[nodiscard]] constexpr T exchange(T& obj, U&& new_value)
{
    T old = oc::move(obj);
    obj = oc::forward<U>(new_value);
    return old;
}

/// b if a < b, else a. Needs only operator<.
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return a < b ? b : a; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Precondition: value > 0
template <class T>
[[nodiscard]] constexpr bool is_power_of_two(T value)
{
    OC_ASSERT(value > 0, "is_power_of_two requires a positive value");
    return (value & (value - 1)) == 0;
}

/// Smallest power of two >= value, e.g. 9 -> 16, 16 -> 16.
/// Precondition: value > 0
template <class T>
[[nodiscard]] constexpr T ceil_power_of_two(T value)
{
    OC_ASSERT(value > 0, "ceil_power_of_two requires a positive value");
    T p = 1;
    while (p < value)
        p *= 2;
    return p;
}

/// Rounds value up to a multiple of alignment, e.g. align_up(300, 16) == 304.
/// Precondition: alignment is a power of two
template <class T>
[[nodiscard]] constexpr T align_up(T value, isize alignment)
{
    OC_ASSERT(alignment > 0 && is_power_of_two(alignment), "alignment must be a power of two");
    return T((isize(value) + alignment - 1) & ~(alignment - 1));
}

/// Works for integers and pointers.
/// Precondition: alignment is a power of two
template <class T>
[[nodiscard]] bool is_aligned(T value, isize alignment)
{
    OC_ASSERT(alignment > 0 && is_power_of_two(alignment), "alignment must be a power of two");
    return (isize(value) & (alignment - 1)) == 0;
}

/// Selects the placement operator new declared below, so no header needs <new>.
///   new (oc::placement_new, ptr) T(args...);
struct placement_new_t
{
};
inline constexpr placement_new_t placement_new = {};

/// Raw, correctly aligned room for one T. Never constructs or destroys `value` on its own.
/// Keeps T's trivial destructibility so wrappers around it can stay trivial.
template <class T>
union storage_for
{
    constexpr storage_for() {}

    constexpr ~storage_for()
        requires std::is_trivially_destructible_v<T>
    = default;
    constexpr ~storage_for()
        requires(!std::is_trivially_destructible_v<T>)
    {
    }

    T value;
};

template <class... T>
constexpr bool always_false = false;

namespace impl
{
template <class Sig>
struct function_ptr_of
{
    static_assert(always_false<Sig>, "function_ptr expects a function signature like void(int)");
};
template <class R, class... Args>
struct function_ptr_of<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

/// oc::function_ptr<void(byte*, isize)> is void (*)(byte*, isize)
template <class Sig>
using function_ptr = typename impl::function_ptr_of<Sig>::type;

/// Empty end marker, compared against an iterator that knows when it is done.
struct sentinel
{
};
} // namespace oc

[[nodiscard]] inline void* operator new(std::size_t, oc::placement_new_t, void* where) noexcept
{
    return where;
}
inline void operator delete(void*, oc::placement_new_t, void*) noexcept {}

#pragma once

#include <ordered-core/fwd.hh>

#include <cstddef>
#include <type_traits>
#include <utility>

/// Two named values, an aggregate: `oc::pair<int, int>{1, 2}`.
///
/// Map iteration hands out pairs of references,
///   oc::map:         pair<K const&, V&>
///   oc::ordered_map: pair<K const&, V const&>
/// and structured bindings on them bind straight to the container's storage:
///   for (auto [key, value] : m) value += 1;   // writes into m
template <class T, class U>
struct oc::pair
{
    T first;
    U second;

    /// Tuple protocol for structured bindings.
    /// Returns the member with its declared reference-ness, so pair<K const&, V&> yields K const& and V&.
    template <std::size_t I>
    [[nodiscard]] constexpr decltype(auto) get() const&
    {
        static_assert(I < 2, "oc::pair has two elements");
        if constexpr (I == 0)
            return (first);
        else
            return (second);
    }
    template <std::size_t I>
    [[nodiscard]] constexpr decltype(auto) get() &
    {
        static_assert(I < 2, "oc::pair has two elements");
        if constexpr (I == 0)
            return (first);
        else
            return (second);
    }

    /// Memberwise equality, only for value pairs.
    [[nodiscard]] friend constexpr bool operator==(pair const& a, pair const& b)
        requires(!std::is_reference_v<T> && !std::is_reference_v<U>)
    {
        return a.first == b.first && a.second == b.second;
    }
};

template <class T, class U>
struct std::tuple_size<oc::pair<T, U>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class T, class U>
struct std::tuple_element<I, oc::pair<T, U>>
{
    using type = std::conditional_t<I == 0, T, U>;
};

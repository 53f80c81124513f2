#pragma once

#include <ordered-core/fwd.hh>

#include <string>
#include <string_view>
#include <type_traits>

// =========================================================================================================
// Hashing for oc::map and oc::ordered_map
// =========================================================================================================
//
// oc::hash<T> is a stateless functor returning a 64 bit hash:
//   - integers, enums, bool and char types: avalanche finalizer over the bit pattern
//   - pointers: same finalizer over the address
//   - std::string, std::string_view, char const*: FNV-1a over the characters
//
// The string specializations are transparent: all three hash the same characters to the same value,
// so a map keyed by std::string can be queried with a std::string_view or a literal without allocating.
//
// Custom key types specialize oc::hash<T> with `u64 operator()(T const&) const`.
// Combine member hashes with oc::hash_combine.
//
// oc::keys_equal is the matching equality: C strings compare by characters, not by address,
// so two buffers holding the same text are the same key.

namespace oc
{
/// 64 bit finalizer (murmur3 fmix64), every input bit affects every output bit.
[[nodiscard]] constexpr u64 hash_mix(u64 x)
{
    x ^= x >> 33;
    x *= 0xff51afd7ed558ccdull;
    x ^= x >> 33;
    x *= 0xc4ceb9fe1a85ec53ull;
    x ^= x >> 33;
    return x;
}

/// FNV-1a over raw characters.
[[nodiscard]] constexpr u64 hash_string(std::string_view s)
{
    u64 h = 0xcbf29ce484222325ull;
    for (char const c : s)
    {
        h ^= u64(u8(c));
        h *= 0x100000001b3ull;
    }
    return h;
}

/// Order dependent combination of two hashes.
/// Usage:
///   u64 operator()(point const& p) const { return oc::hash_combine(oc::hash<int>{}(p.x), oc::hash<int>{}(p.y)); }
[[nodiscard]] constexpr u64 hash_combine(u64 seed, u64 h)
{
    return seed ^ (h + 0x9e3779b97f4a7c15ull + (seed << 6) + (seed >> 2));
}
} // namespace oc

template <class T>
struct oc::hash
{
    static_assert(std::is_integral_v<T> || std::is_enum_v<T> || std::is_pointer_v<T>,
                  "no oc::hash<T> for this type, please provide a specialization");

    [[nodiscard]] constexpr u64 operator()(T const& value) const
    {
        if constexpr (std::is_pointer_v<T>)
            return oc::hash_mix(u64(reinterpret_cast<std::uintptr_t>(value)));
        else if constexpr (std::is_enum_v<T>)
            return oc::hash_mix(u64(std::underlying_type_t<T>(value)));
        else
            return oc::hash_mix(u64(value));
    }
};

namespace oc::impl
{
struct string_hash
{
    [[nodiscard]] constexpr u64 operator()(std::string_view s) const { return oc::hash_string(s); }
};
} // namespace oc::impl

template <>
struct oc::hash<std::string> : oc::impl::string_hash
{
};

template <>
struct oc::hash<std::string_view> : oc::impl::string_hash
{
};

template <>
struct oc::hash<char const*> : oc::impl::string_hash
{
};

namespace oc
{
namespace impl
{
template <class T>
constexpr bool is_c_string = std::is_same_v<std::decay_t<T>, char const*> || std::is_same_v<std::decay_t<T>, char*>;
}

/// Key comparison used by oc::map. Falls back to `a == b` unless one side is a C string.
/// C strings must not be nullptr.
template <class A, class B>
[[nodiscard]] constexpr bool keys_equal(A const& a, B const& b)
{
    if constexpr (impl::is_c_string<A> || impl::is_c_string<B>)
        return std::string_view(a) == std::string_view(b);
    else
        return a == b;
}
} // namespace oc

#pragma once

#include <cstddef>
#include <cstdint>

// Primitive aliases and forward declarations for all of ordered-core.
// Every type is declared here and defined in its own header as `struct oc::name { ... };`.

namespace oc
{
using i8 = std::int8_t;
using i16 = std::int16_t;
using i32 = std::int32_t;
using i64 = std::int64_t;

using u8 = std::uint8_t;
using u16 = std::uint16_t;
using u32 = std::uint32_t;
using u64 = std::uint64_t;

using byte = std::byte;

/// Sizes, indices and Order Log positions.
/// Signed, so `size() - 1` on an empty container is -1 and -1 can mark an empty bucket.
using isize = i64;

using nullptr_t = std::nullptr_t;

// memory
struct memory_resource;
template <class T>
struct allocation;

// values and views
struct nullopt_t;
template <class T>
struct optional;
template <class T, class U>
struct pair;
template <class T>
struct span;

// containers
template <class T>
struct vector;

template <class T>
struct hash;

/// Unordered hash map, also the Index of ordered_map.
template <class K, class V, class Hash = oc::hash<K>>
struct map;

/// Hash map iterating in first-insertion order.
template <class K, class V, class Hash = oc::hash<K>>
struct ordered_map;
} // namespace oc

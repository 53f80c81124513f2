#pragma once

#include <ordered-core/allocation.hh>
#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/impl/object_lifetime_util.hh>
#include <ordered-core/span.hh>
#include <ordered-core/utility.hh>

#include <type_traits>

/// Dynamically allocated array of T with deep-copy value semantics, similar to std::vector.
/// Owns its elements through an oc::allocation<T>; the memory resource travels with the allocation.
///
/// Growth is back-only and doubles the allocation, so push_back is amortized O(1).
/// Any reallocation invalidates pointers, references and iterators.
/// Elements may be constructed from other elements of the same vector (`v.push_back(v[0])`),
/// the new element is always built before old ones are moved.
///
/// This is the storage for every part of an ordered_map:
/// the index rows, the bucket table and the Order Log are all oc::vectors.
template <class T>
struct oc::vector
{
    /// Allocations are aligned to (and sized in multiples of) a cache line,
    /// so two vectors never share a line.
    static constexpr isize cache_line_size = 64;
    static constexpr isize alloc_alignment = oc::max(isize(alignof(T)), cache_line_size);

    // element access
public:
    /// Precondition: 0 <= i < size()
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        OC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        OC_ASSERT(0 <= i && i < size(), "index out of bounds");
        return _data.obj_start[i];
    }

    /// Precondition: !empty()
    [[nodiscard]] constexpr T& front()
    {
        OC_ASSERT(!empty(), "front() called on empty vector");
        return *_data.obj_start;
    }
    [[nodiscard]] constexpr T const& front() const
    {
        OC_ASSERT(!empty(), "front() called on empty vector");
        return *_data.obj_start;
    }

    /// Precondition: !empty()
    [[nodiscard]] constexpr T& back()
    {
        OC_ASSERT(!empty(), "back() called on empty vector");
        return *(_data.obj_end - 1);
    }
    [[nodiscard]] constexpr T const& back() const
    {
        OC_ASSERT(!empty(), "back() called on empty vector");
        return *(_data.obj_end - 1);
    }

    [[nodiscard]] constexpr T* data() { return _data.obj_start; }
    [[nodiscard]] constexpr T const* data() const { return _data.obj_start; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data.obj_start; }
    [[nodiscard]] constexpr T* end() { return _data.obj_end; }
    [[nodiscard]] constexpr T const* begin() const { return _data.obj_start; }
    [[nodiscard]] constexpr T const* end() const { return _data.obj_end; }

    // views
public:
    [[nodiscard]] constexpr oc::span<T> as_span() { return oc::span<T>(_data.obj_start, _data.obj_end); }
    [[nodiscard]] constexpr oc::span<T const> as_span() const
    {
        return oc::span<T const>(_data.obj_start, _data.obj_end);
    }

    // queries
public:
    [[nodiscard]] constexpr isize size() const { return _data.obj_end - _data.obj_start; }
    [[nodiscard]] constexpr bool empty() const { return _data.obj_end == _data.obj_start; }

    /// Number of elements that fit without reallocation.
    [[nodiscard]] constexpr isize capacity() const
    {
        return (_data.alloc_end - (oc::byte*)_data.obj_start) / isize(sizeof(T));
    }

    /// Memory resource used for (re)allocations, nullptr means oc::default_memory_resource.
    [[nodiscard]] constexpr memory_resource const* resource() const { return _data.custom_resource; }

    // factories
public:
    /// Empty vector that can hold at least `capacity` elements before reallocating.
    [[nodiscard]] static vector create_with_capacity(isize capacity, memory_resource const* resource = nullptr)
    {
        OC_ASSERT(capacity >= 0, "capacity must be non-negative");
        vector v;
        v._data = allocate_for(capacity, resource);
        return v;
    }

    /// `size` copies of `value`.
    [[nodiscard]] static vector create_filled(isize size, T const& value, memory_resource const* resource = nullptr)
    {
        auto v = create_with_capacity(size, resource);
        impl::fill_create_objects_to(v._data.obj_end, size, value);
        return v;
    }

    /// Deep copy of `source`.
    [[nodiscard]] static vector create_copy_of(oc::span<T const> source, memory_resource const* resource = nullptr)
    {
        auto v = create_with_capacity(source.size(), resource);
        impl::copy_create_objects_to(v._data.obj_end, source.begin(), source.end());
        return v;
    }

    // capacity
public:
    /// Ensures capacity() >= min_capacity. Never shrinks.
    void reserve(isize min_capacity)
    {
        if (min_capacity <= capacity())
            return;

        auto new_data = allocate_for(min_capacity, _data.custom_resource);
        impl::move_create_objects_to(new_data.obj_end, _data.obj_start, _data.obj_end);
        _data = oc::move(new_data);
    }

    // modifiers
public:
    /// Destroys all elements, keeps the allocation.
    constexpr void clear()
    {
        impl::destroy_objects_in_reverse(_data.obj_start, _data.obj_end);
        _data.obj_end = _data.obj_start;
    }

    /// Constructs a new element at the back, growing the allocation if it is full.
    /// Amortized O(1).
    template <class... Args>
    constexpr T& emplace_back(Args&&... args)
    {
        static_assert(requires { T(oc::forward<Args>(args)...); }, "emplace_back: T is not constructible from "
                                                                   "the provided argument types");

        if (_data.obj_start + capacity() == _data.obj_end) [[unlikely]]
            return emplace_back_grow(oc::forward<Args>(args)...);

        auto const p = new (oc::placement_new, _data.obj_end) T(oc::forward<Args>(args)...);
        _data.obj_end++; // after construction, so a throwing T(...) leaves us untouched
        return *p;
    }

    constexpr T& push_back(T const& value) { return emplace_back(value); }
    constexpr T& push_back(T&& value) { return emplace_back(oc::move(value)); }

    /// Removes and returns the last element.
    /// Precondition: !empty()
    [[nodiscard("use remove_back() if you don't need the return value")]] constexpr T pop_back()
    {
        OC_ASSERT(!empty(), "pop_back() called on empty vector");
        auto value = oc::move(*(_data.obj_end - 1));
        remove_back();
        return value;
    }

    /// Precondition: !empty()
    constexpr void remove_back()
    {
        OC_ASSERT(!empty(), "remove_back() called on empty vector");
        _data.obj_end--;
        _data.obj_end->~T();
    }

    /// Removes element `idx` by moving the last element into its place. O(1), does not keep order.
    /// Precondition: 0 <= idx < size()
    constexpr void remove_at_unordered(isize idx)
    {
        OC_ASSERT(0 <= idx && idx < size(), "index out of bounds");

        auto const p_obj = _data.obj_start + idx;
        _data.obj_end--;
        if (p_obj != _data.obj_end)
            *p_obj = oc::move(*_data.obj_end);
        _data.obj_end->~T();
    }

    /// Like remove_at_unordered but returns the removed element.
    [[nodiscard("use remove_at_unordered() if you don't need the return value")]] constexpr T pop_at_unordered(isize idx)
    {
        OC_ASSERT(0 <= idx && idx < size(), "index out of bounds");
        auto value = oc::move(_data.obj_start[idx]);
        remove_at_unordered(idx);
        return value;
    }

    // lifecycle
public:
    vector() = default;
    ~vector() = default;

    vector(vector&&) = default;
    vector& operator=(vector&&) = default;

    /// Deep copy, uses the resource of rhs.
    vector(vector const& rhs)
    {
        _data = allocate_for(rhs.size(), rhs._data.custom_resource);
        impl::copy_create_objects_to(_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
    }

    /// Deep copy, keeps our own resource.
    vector& operator=(vector const& rhs)
    {
        if (this != &rhs)
        {
            auto new_data = allocate_for(rhs.size(), _data.custom_resource);
            impl::copy_create_objects_to(new_data.obj_end, rhs._data.obj_start, rhs._data.obj_end);
            _data = oc::move(new_data);
        }
        return *this;
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(vector const& lhs, vector const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        if (lhs.size() != rhs.size())
            return false;
        for (isize i = 0; i < lhs.size(); ++i)
            if (!(lhs._data.obj_start[i] == rhs._data.obj_start[i]))
                return false;
        return true;
    }

private:
    [[nodiscard]] static allocation<T> allocate_for(isize count, memory_resource const* resource)
    {
        auto const byte_size = oc::align_up(count * isize(sizeof(T)), alloc_alignment);
        return allocation<T>::create_empty_bytes(byte_size, byte_size, alloc_alignment, resource);
    }

    // growth path for emplace_back, kept out of line so the happy path inlines
    template <class... Args>
    OC_COLD_FUNC constexpr T& emplace_back_grow(Args&&... args)
    {
        auto const old_size = size();
        auto const new_capacity = oc::max(capacity() * 2, isize(alloc_alignment / isize(sizeof(T)) + 1));

        auto new_data = allocate_for(new_capacity, _data.custom_resource);

        // construct the new element first, args may reference our current elements
        new_data.obj_start += old_size;
        new_data.obj_end = new_data.obj_start;
        auto const p = new (oc::placement_new, new_data.obj_end) T(oc::forward<Args>(args)...);
        new_data.obj_end++;

        // then move the old elements in front of it
        // new_data only tracks the new element, so a throwing move has to clean up the moved prefix itself
        T* dest = (T*)new_data.alloc_start;
        try
        {
            impl::move_create_objects_to(dest, _data.obj_start, _data.obj_end);
        }
        catch (...)
        {
            impl::destroy_objects_in_reverse((T*)new_data.alloc_start, dest);
            throw;
        }
        new_data.obj_start = (T*)new_data.alloc_start;

        _data = oc::move(new_data);
        return *p;
    }

private:
    oc::allocation<T> _data;
};

#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>

#include <type_traits>

/// Pointer + length view of contiguous T, the non-owning counterpart of oc::vector.
///
/// ordered_map exposes its Order Log as span<K const> (order_log(), cursor::remaining()).
/// Such views dangle after the next mutation of the map.
///
/// span<T> converts to span<T const>, never the other way.
template <class T>
struct oc::span
{
    constexpr span() = default;

    /// [ptr, ptr + size)
    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        OC_ASSERT(size >= 0, "negative span size");
    }

    /// [first, last)
    constexpr explicit span(T* first, T* last) : _data(first), _size(last - first)
    {
        OC_ASSERT(first <= last, "span range is reversed");
    }

    template <class U>
        requires std::is_same_v<T, U const>
    constexpr span(span<U> mutable_view) : _data(mutable_view.data()), _size(mutable_view.size())
    {
    }

    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

    /// nullptr for a default constructed span
    [[nodiscard]] constexpr T* data() const { return _data; }

    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        OC_ASSERT(0 <= i && i < _size, "span index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T& front() const
    {
        OC_ASSERT(_size > 0, "front() on empty span");
        return _data[0];
    }

    [[nodiscard]] constexpr T& back() const
    {
        OC_ASSERT(_size > 0, "back() on empty span");
        return _data[_size - 1];
    }

    /// The last size() - count elements.
    [[nodiscard]] constexpr span drop_front(isize count) const
    {
        OC_ASSERT(0 <= count && count <= _size, "drop_front past the end of the span");
        return span(_data + count, _size - count);
    }

private:
    T* _data = nullptr;
    isize _size = 0;
};

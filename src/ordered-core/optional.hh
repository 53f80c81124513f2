#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/utility.hh>

#include <type_traits>

/// Tag type of oc::nullopt.
/// Has no default constructor, so `opt = {}` can only mean "empty optional".
struct oc::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace oc
{
inline constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace oc

/// A T or nothing.
///
/// The library returns it wherever absence is an ordinary outcome:
/// the displaced value of map::insert / ordered_map::insert, the removed value of remove(),
/// and the next entry of an ordered_map cursor.
///
/// Deliberately smaller than std::optional:
/// no operator* or operator-> (value() asserts engagement), no ordering, no contextual bool.
/// optional<T> is trivially copyable / destructible exactly when T is.
template <class T>
struct oc::optional
{
public:
    optional() = default;
    optional(nullopt_t) {}

    template <class U = std::remove_cv_t<T>>
        requires(!std::is_same_v<std::remove_cvref_t<U>, optional> && !std::is_same_v<std::remove_cvref_t<U>, nullopt_t>
                 && std::is_constructible_v<T, U &&>)
    explicit(!std::is_convertible_v<U, T>) constexpr optional(U&& value) // NOLINT
    {
        emplace_unchecked(oc::forward<U>(value));
    }

    // special members: defaulted for trivially copyable T, hand-written otherwise
public:
    optional(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional const&)
        requires std::is_trivially_copyable_v<T>
    = default;
    optional& operator=(optional&&)
        requires std::is_trivially_copyable_v<T>
    = default;
    ~optional()
        requires std::is_trivially_destructible_v<T>
    = default;

    optional(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T>)
    {
        if (rhs._has_value)
            emplace_unchecked(rhs._storage.value);
    }

    /// Leaves rhs empty.
    optional(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        if (rhs._has_value)
        {
            emplace_unchecked(oc::move(rhs._storage.value));
            rhs.reset();
        }
    }

    optional& operator=(optional const& rhs)
        requires(!std::is_trivially_copyable_v<T> && std::is_copy_constructible_v<T> && std::is_copy_assignable_v<T>)
    {
        if (this != &rhs)
            assign_from(rhs._has_value, rhs._storage.value);
        return *this;
    }

    /// rhs stays engaged with a moved-from value.
    /// Safe when rhs lives inside our own value: nothing is destroyed before the move.
    optional& operator=(optional&& rhs) noexcept
        requires(!std::is_trivially_copyable_v<T>)
    {
        assign_from(rhs._has_value, oc::move(rhs._storage.value));
        return *this;
    }

    ~optional()
        requires(!std::is_trivially_destructible_v<T>)
    {
        reset();
    }

    // access
public:
    [[nodiscard]] bool has_value() const { return _has_value; }

    /// The held value, with the constness and value category of *this.
    template <class Self>
    [[nodiscard]] auto&& value(this Self&& self)
    {
        OC_ASSERT(self._has_value, "value() called on empty optional");
        return static_cast<Self&&>(self)._storage.value;
    }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) const&
    {
        if (_has_value)
            return _storage.value;
        return T(oc::forward<U>(fallback));
    }

    template <class U>
    [[nodiscard]] T value_or(U&& fallback) &&
    {
        if (_has_value)
            return T(oc::move(_storage.value));
        return T(oc::forward<U>(fallback));
    }

    void reset()
    {
        if (!_has_value)
            return;
        if constexpr (!std::is_trivially_destructible_v<T>)
            _storage.value.~T();
        _has_value = false;
    }

    // comparison
public:
    [[nodiscard]] friend bool operator==(optional const& a, optional const& b)
        requires requires(T const& v) { bool(v == v); }
    {
        if (a._has_value != b._has_value)
            return false;
        return !a._has_value || bool(a._storage.value == b._storage.value);
    }

    [[nodiscard]] friend bool operator==(optional const& a, T const& b)
        requires requires(T const& v) { bool(v == v); }
    {
        return a._has_value && bool(a._storage.value == b);
    }

    [[nodiscard]] friend bool operator==(optional const& a, nullopt_t) { return !a._has_value; }

    // optional<int> == true would silently compare against 1
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<T, bool>)
    = delete;

private:
    // precondition: !_has_value
    template <class... Args>
    void emplace_unchecked(Args&&... args)
    {
        new (oc::placement_new, &_storage.value) T(oc::forward<Args>(args)...);
        _has_value = true;
    }

    template <class V>
    void assign_from(bool rhs_has_value, V&& rhs_value)
    {
        if (!rhs_has_value)
            reset();
        else if (_has_value)
            _storage.value = oc::forward<V>(rhs_value);
        else
            emplace_unchecked(oc::forward<V>(rhs_value));
    }

private:
    oc::storage_for<T> _storage;
    bool _has_value = false;
};

#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/hash.hh>
#include <ordered-core/optional.hh>
#include <ordered-core/pair.hh>
#include <ordered-core/utility.hh>
#include <ordered-core/vector.hh>

/// Unordered hash map from K to V.
///
/// Layout:
///   _rows     dense vector of {key, value, hash}, no holes
///   _buckets  power-of-two table of row indices (-1 = empty), linear probing
///
/// Removal uses backward-shift deletion, so the bucket table never contains tombstones,
/// and fills the hole in _rows with the last row (iteration order is therefore unspecified).
/// The table grows when more than 7/8 of the buckets would be occupied.
///
/// Lookup is heterogeneous: any Q with `Hash{}(q)` and `oc::keys_equal(key, q)` works,
/// e.g. std::string_view or string literals against std::string keys.
/// Hash must produce identical values for K and every Q it is queried with.
///
/// Pointers returned by get() are invalidated by insert, remove, clear and reserve.
template <class K, class V, class Hash>
struct oc::map
{
    struct row
    {
        K key;
        V value;
        u64 hash;
    };

    static constexpr isize min_bucket_count = 8;

    // lookup
public:
    /// nullptr if key is absent
    template <class Q>
    [[nodiscard]] V const* get(Q const& key) const
    {
        auto const b = find_bucket(key, Hash{}(key));
        return b < 0 ? nullptr : &_rows[_buckets[b]].value;
    }
    template <class Q>
    [[nodiscard]] V* get(Q const& key)
    {
        auto const b = find_bucket(key, Hash{}(key));
        return b < 0 ? nullptr : &_rows[_buckets[b]].value;
    }

    template <class Q>
    [[nodiscard]] bool contains_key(Q const& key) const
    {
        return find_bucket(key, Hash{}(key)) >= 0;
    }

    // queries
public:
    [[nodiscard]] isize size() const { return _rows.size(); }
    [[nodiscard]] bool empty() const { return _rows.empty(); }

    /// Number of entries the current bucket table holds before it has to grow.
    [[nodiscard]] isize capacity() const { return max_entries_for(_buckets.size()); }

    // modifiers
public:
    /// Inserts or overwrites. Returns the previous value if key was present.
    optional<V> insert(K key, V value)
    {
        auto const h = Hash{}(key);
        auto const b = find_bucket(key, h);
        if (b >= 0)
            return optional<V>(oc::exchange(_rows[_buckets[b]].value, oc::move(value)));

        if (_rows.size() + 1 > capacity()) [[unlikely]]
            rehash(oc::max(_buckets.size() * 2, min_bucket_count));

        auto const r = _rows.size();
        _rows.push_back(row{oc::move(key), oc::move(value), h});
        _buckets[free_bucket_for(h)] = r;
        return oc::nullopt;
    }

    /// Removes key and returns its value, nullopt if it was absent.
    template <class Q>
    optional<V> remove(Q const& key)
    {
        auto const b = find_bucket(key, Hash{}(key));
        if (b < 0)
            return oc::nullopt;

        auto const r = _buckets[b];
        erase_bucket(b);

        // the last row moves into the hole, repoint its bucket first
        auto const last = _rows.size() - 1;
        if (r != last)
            _buckets[bucket_of_row(last)] = r;

        optional<V> result = oc::move(_rows[r].value);
        _rows.remove_at_unordered(r);
        return result;
    }

    /// Removes all entries, keeps the allocations.
    void clear()
    {
        _rows.clear();
        for (auto& b : _buckets)
            b = -1;
    }

    /// Makes room for `count` entries without rehashing.
    void reserve(isize count)
    {
        _rows.reserve(count);

        // smallest table whose 7/8 load limit admits `count` entries
        auto bucket_count = oc::ceil_power_of_two(oc::max(count + count / 7 + 1, min_bucket_count));
        if (max_entries_for(bucket_count) < count)
            bucket_count *= 2;

        if (bucket_count > _buckets.size())
            rehash(bucket_count);
    }

    // iteration
public:
    template <bool IsConst>
    struct iterator
    {
        using row_ptr = std::conditional_t<IsConst, row const*, row*>;
        using value_ref = std::conditional_t<IsConst, V const&, V&>;

        row_ptr _row;

        [[nodiscard]] pair<K const&, value_ref> operator*() const { return {_row->key, _row->value}; }
        iterator& operator++()
        {
            ++_row;
            return *this;
        }
        [[nodiscard]] bool operator!=(iterator const& rhs) const { return _row != rhs._row; }
        [[nodiscard]] bool operator==(iterator const& rhs) const { return _row == rhs._row; }
    };

    /// Visits every entry once, in unspecified order.
    [[nodiscard]] iterator<false> begin() { return {_rows.begin()}; }
    [[nodiscard]] iterator<false> end() { return {_rows.end()}; }
    [[nodiscard]] iterator<true> begin() const { return {_rows.begin()}; }
    [[nodiscard]] iterator<true> end() const { return {_rows.end()}; }

    // lifecycle
public:
    map() = default;
    ~map() = default;
    map(map&&) = default;
    map& operator=(map&&) = default;
    map(map const&) = default;
    map& operator=(map const&) = default;

private:
    [[nodiscard]] static constexpr isize max_entries_for(isize bucket_count) { return bucket_count / 8 * 7; }

    [[nodiscard]] isize mask() const { return _buckets.size() - 1; }

    // bucket holding `key`, or -1
    template <class Q>
    [[nodiscard]] isize find_bucket(Q const& key, u64 h) const
    {
        if (_buckets.empty())
            return -1;

        auto const m = mask();
        for (auto b = isize(h) & m;; b = (b + 1) & m)
        {
            auto const r = _buckets[b];
            if (r < 0)
                return -1;

            auto const& rw = _rows[r];
            if (rw.hash == h && oc::keys_equal(rw.key, key))
                return b;
        }
    }

    // first empty bucket on the probe sequence of h
    // load factor < 1 guarantees termination
    [[nodiscard]] isize free_bucket_for(u64 h) const
    {
        auto const m = mask();
        auto b = isize(h) & m;
        while (_buckets[b] >= 0)
            b = (b + 1) & m;
        return b;
    }

    // bucket pointing at row `r`, which must be present
    [[nodiscard]] isize bucket_of_row(isize r) const
    {
        auto const m = mask();
        auto b = isize(_rows[r].hash) & m;
        while (_buckets[b] != r)
        {
            OC_ASSERT(_buckets[b] >= 0, "row is not referenced by any bucket");
            b = (b + 1) & m;
        }
        return b;
    }

    // backward-shift deletion: pull later members of the probe run into the hole
    void erase_bucket(isize hole)
    {
        auto const m = mask();
        auto j = hole;
        while (true)
        {
            j = (j + 1) & m;
            auto const r = _buckets[j];
            if (r < 0)
                break;

            // entry at j may only move back if the hole is not before its home bucket
            auto const home = isize(_rows[r].hash) & m;
            if (((j - home) & m) >= ((j - hole) & m))
            {
                _buckets[hole] = r;
                hole = j;
            }
        }
        _buckets[hole] = -1;
    }

    void rehash(isize bucket_count)
    {
        OC_ASSERT(oc::is_power_of_two(bucket_count), "bucket count must be a power of two");

        _buckets = vector<isize>::create_filled(bucket_count, -1, _buckets.resource());
        for (isize r = 0; r < _rows.size(); ++r)
            _buckets[free_bucket_for(_rows[r].hash)] = r;
    }

private:
    vector<row> _rows;
    vector<isize> _buckets;
};

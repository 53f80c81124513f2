#pragma once

#include <ordered-core/assert.hh>
#include <ordered-core/fwd.hh>
#include <ordered-core/hash.hh>
#include <ordered-core/map.hh>
#include <ordered-core/optional.hh>
#include <ordered-core/pair.hh>
#include <ordered-core/span.hh>
#include <ordered-core/utility.hh>
#include <ordered-core/vector.hh>

// =========================================================================================================
// oc::ordered_map: hash map that iterates in first-insertion order
// =========================================================================================================
//
// Two structures:
//   Index      oc::map<K, indexed_value>   key -> {value, slot}, owns all values
//   Order Log  oc::vector<K>               keys in the order they were inserted while absent
//
// insert appends to the Order Log only when the key is new, overwriting keeps the original position.
// remove only touches the Index. The Order Log slot stays behind as a tombstone,
// iteration skips it and compact() drops all of them.
//
// A key can own several Order Log slots (removed, then inserted again).
// Only the most recent one is live: the Index row remembers its position in `slot`,
// and a slot p is live iff its key is in the Index with slot == p.
//
// Cursors (iter(), range-for) are read-only views. Every structural mutation bumps a generation counter,
// and a cursor that observes a different generation than the one it was created with asserts.
//
// Usage:
//   oc::ordered_map<std::string, int> m;
//   m.insert("b", 1);
//   m.insert("a", 2);
//   m.remove("b");
//   for (auto const& [k, v] : m) ...   // visits ("a", 2)

namespace oc
{
/// Index row payload of an ordered_map: the value plus the Order Log position of the key's live slot.
template <class V>
struct indexed_value
{
    V value;
    isize slot;
};
} // namespace oc

template <class K, class V, class Hash>
struct oc::ordered_map
{
    using index_t = oc::map<K, oc::indexed_value<V>, Hash>;

    /// One live (key, value) pair produced by a cursor.
    /// Both pointers refer into the map and are invalidated by any mutation.
    struct entry
    {
        [[nodiscard]] K const& key() const { return *_key; }
        [[nodiscard]] V const& value() const { return *_value; }

        K const* _key;
        V const* _value;
    };

    /// Single-pass, read-only walk over the Order Log.
    /// Obtained from iter(); any number of cursors may exist at once.
    /// Using a cursor after the map was mutated is a contract violation.
    struct cursor
    {
        /// Next live entry, skipping tombstones.
        /// Once it returned nullopt it keeps returning nullopt.
        [[nodiscard]] optional<entry> next()
        {
            OC_ASSERT(_map->_generation == _generation, "ordered_map was modified while a cursor over it was in use");

            auto const& log = _map->_order_log;
            while (_position < log.size())
            {
                auto const p = _position++;
                auto const* iv = _map->_index.get(log[p]);
                if (iv != nullptr && iv->slot == p)
                    return entry{&log[p], &iv->value};
            }
            return oc::nullopt;
        }

        /// Order Log slots not consumed yet, tombstones included.
        [[nodiscard]] span<K const> remaining() const
        {
            OC_ASSERT(_map->_generation == _generation, "ordered_map was modified while a cursor over it was in use");
            return _map->order_log().drop_front(_position);
        }

        /// True once every slot was consumed.
        /// Trailing tombstones still count as unconsumed, next() would return nullopt for them.
        [[nodiscard]] bool is_exhausted() const
        {
            OC_ASSERT(_map->_generation == _generation, "ordered_map was modified while a cursor over it was in use");
            return _position >= _map->_order_log.size();
        }

        ordered_map const* _map;
        u64 _generation;
        isize _position;
    };

    /// Input iterator for range-for, see begin()/end().
    struct iterator
    {
        [[nodiscard]] pair<K const&, V const&> operator*() const
        {
            OC_ASSERT(_current.has_value(), "dereferencing an exhausted ordered_map iterator");
            auto const& e = _current.value();
            return {e.key(), e.value()};
        }

        iterator& operator++()
        {
            OC_ASSERT(_current.has_value(), "incrementing an exhausted ordered_map iterator");
            _current = _cursor.next();
            return *this;
        }

        [[nodiscard]] bool operator!=(oc::sentinel) const { return _current.has_value(); }
        [[nodiscard]] bool operator==(oc::sentinel) const { return !_current.has_value(); }

        cursor _cursor;
        optional<entry> _current;
    };

    // lookup
public:
    /// nullptr if key is absent
    template <class Q>
    [[nodiscard]] V const* get(Q const& key) const
    {
        auto const* iv = _index.get(key);
        return iv ? &iv->value : nullptr;
    }

    /// Mutable access to a present value. Does not count as a structural change, live cursors stay valid.
    template <class Q>
    [[nodiscard]] V* get_mut(Q const& key)
    {
        auto* iv = _index.get(key);
        return iv ? &iv->value : nullptr;
    }

    template <class Q>
    [[nodiscard]] bool contains_key(Q const& key) const
    {
        return _index.contains_key(key);
    }

    /// Read-only access to the underlying Index.
    [[nodiscard]] index_t const& index() const { return _index; }

    // queries
public:
    /// Number of live entries.
    [[nodiscard]] isize size() const { return _index.size(); }
    [[nodiscard]] bool empty() const { return _index.empty(); }

    /// Number of Order Log slots, live and tombstoned.
    [[nodiscard]] isize order_log_size() const { return _order_log.size(); }

    [[nodiscard]] isize tombstone_count() const { return _order_log.size() - _index.size(); }

    /// Every Order Log slot in insertion order, tombstones included.
    [[nodiscard]] span<K const> order_log() const { return _order_log.as_span(); }

    // modifiers
public:
    /// Inserts or overwrites.
    /// A new key is appended to the Order Log, an existing key keeps its position.
    /// Returns the previous value if the key was present.
    optional<V> insert(K key, V value)
    {
        ++_generation;

        if (auto* iv = _index.get(key))
            return optional<V>(oc::exchange(iv->value, oc::move(value)));

        auto const slot = _order_log.size();
        _order_log.push_back(key);
        _index.insert(oc::move(key), indexed_value<V>{oc::move(value), slot});
        return oc::nullopt;
    }

    /// Removes key and returns its value, nullopt if absent.
    /// The Order Log keeps the key's slot as a tombstone.
    template <class Q>
    optional<V> remove(Q const& key)
    {
        auto removed = _index.remove(key);
        if (!removed.has_value())
            return oc::nullopt;

        ++_generation;
        return optional<V>(oc::move(removed.value().value));
    }

    /// Removes all entries and all Order Log slots.
    void clear()
    {
        ++_generation;
        _index.clear();
        _order_log.clear();
    }

    /// Drops all tombstones from the Order Log. Iteration order is unchanged.
    void compact()
    {
        ++_generation;

        if (tombstone_count() == 0)
            return;

        auto new_log = vector<K>::create_with_capacity(_index.size(), _order_log.resource());
        for (isize p = 0; p < _order_log.size(); ++p)
        {
            auto* iv = _index.get(_order_log[p]);
            if (iv == nullptr || iv->slot != p)
                continue;

            iv->slot = new_log.size();
            new_log.push_back(oc::move(_order_log[p]));
        }
        _order_log = oc::move(new_log);
    }

    // iteration
public:
    /// Fresh cursor at the front of the current Order Log.
    [[nodiscard]] cursor iter() const { return cursor{this, _generation, 0}; }

    /// Range-for support, visits live entries in first-insertion order.
    /// Usage:
    ///   for (auto const& [key, value] : m) ...
    [[nodiscard]] iterator begin() const
    {
        auto c = iter();
        auto first = c.next();
        return iterator{c, oc::move(first)};
    }
    [[nodiscard]] oc::sentinel end() const { return {}; }

    // lifecycle
public:
    ordered_map() = default;
    ~ordered_map() = default;

    ordered_map(ordered_map const&) = default;
    ordered_map(ordered_map&& rhs) noexcept
      : _index(oc::move(rhs._index)), _order_log(oc::move(rhs._order_log)), _generation(rhs._generation)
    {
        ++rhs._generation;
    }

    ordered_map& operator=(ordered_map const& rhs)
    {
        if (this != &rhs)
        {
            _index = rhs._index;
            _order_log = rhs._order_log;
            ++_generation;
        }
        return *this;
    }
    ordered_map& operator=(ordered_map&& rhs) noexcept
    {
        if (this != &rhs)
        {
            _index = oc::move(rhs._index);
            _order_log = oc::move(rhs._order_log);
            ++_generation;
            ++rhs._generation;
        }
        return *this;
    }

private:
    index_t _index;
    vector<K> _order_log;
    u64 _generation = 0;
};

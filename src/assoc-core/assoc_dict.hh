#pragma once

#include <assoc-core/equality.hh>
#include <assoc-core/function_ref.hh>
#include <assoc-core/fwd.hh>
#include <assoc-core/pair.hh>
#include <assoc-core/span.hh>
#include <assoc-core/utility.hh>
#include <assoc-core/vector.hh>

#include <type_traits>


/// Association-list dictionary: an ordered sequence of unique (key, value) entries.
///
/// Keys only need structural equality (ac::equality_comparable, see <assoc-core/equality.hh>).
/// No hashing and no ordering is used: every lookup is a linear scan.
/// This trades O(1) / O(log n) lookups for correct equality semantics on keys that cannot be
/// hashed or ordered canonically (nested records, types with custom equality, ...).
///
/// Order:
///   Entries are ordered by recency. insert() places its key at the most-recent position,
///   also when the key was already present (the old entry is replaced and repositioned).
///   keys(), values(), entries() and foldl() observe most-recent-first,
///   foldr() observes least-recent-first.
///
/// Value semantics:
///   assoc_dict is immutable from the outside. Every operation that changes content is a const member
///   returning a new dictionary, so a value can be read from many threads without coordination.
///   Copies are deep.
///
/// Equality:
///   operator== / equals() compare the SET of entries and ignore order.
///   same_order_as() is the representational comparison that also checks order.
///
/// Complexity:
///   contains, find, insert, remove: O(n)
///   equals, union_with, intersect_with, diff_with: O(n * m)
///
/// Usage:
///   auto d = ac::assoc_dict<std::string, int>::create_singleton("a", 1);
///   d = d.insert("b", 2).insert("a", 3); // keys() == ["a", "b"]
///   if (auto v = d.find("a"))
///       use(*v); // 3
template <class K, class V>
struct ac::assoc_dict
{
    static_assert(ac::equality_comparable<K>, "keys need structural equality, see ac::equality_traits");
    static_assert(std::is_copy_constructible_v<K> && std::is_copy_constructible_v<V>,
                  "assoc_dict has value semantics and copies its entries");

    using key_t = K;
    using value_t = V;
    using entry_t = ac::pair<K, V>;

    // factories
public:
    [[nodiscard]] static assoc_dict create_empty() { return {}; }

    [[nodiscard]] static assoc_dict create_singleton(K key, V value)
    {
        auto d = assoc_dict::with_capacity(1);
        d._entries.push_back(entry_t{ac::move(key), ac::move(value)});
        return d;
    }

    /// Inserts the entries from right to left (fold-right).
    /// For duplicate keys the leftmost occurrence is inserted last:
    /// its value wins and it ends up at the most-recent position.
    [[nodiscard]] static assoc_dict create_from_list(ac::span<entry_t const> list)
    {
        auto d = assoc_dict::with_capacity(list.size());
        for (auto i = list.size() - 1; i >= 0; --i)
            d.insert_in_place(list[i].first, list[i].second);
        return d;
    }

    // queries
public:
    [[nodiscard]] bool empty() const { return _entries.empty(); }
    [[nodiscard]] isize size() const { return _entries.size(); }

    /// Linear scan, stops at the first match.
    [[nodiscard]] bool contains(K const& key) const { return index_of(key) >= 0; }

    /// Returns the stored value for key, or nullptr if absent.
    /// The pointer is valid as long as this dictionary is alive.
    [[nodiscard]] V const* find(K const& key) const
    {
        auto const idx = index_of(key);
        return idx >= 0 ? &_entries[idx].second : nullptr;
    }

    /// Keys, most-recent-first.
    [[nodiscard]] ac::vector<K> keys() const
    {
        auto result = ac::vector<K>::create_with_capacity(size());
        for (auto i = size() - 1; i >= 0; --i)
            result.push_back(_entries[i].first);
        return result;
    }

    /// Values, most-recent-first (parallel to keys()).
    [[nodiscard]] ac::vector<V> values() const
    {
        auto result = ac::vector<V>::create_with_capacity(size());
        for (auto i = size() - 1; i >= 0; --i)
            result.push_back(_entries[i].second);
        return result;
    }

    /// (key, value) entries, most-recent-first.
    [[nodiscard]] ac::vector<entry_t> entries() const
    {
        auto result = ac::vector<entry_t>::create_with_capacity(size());
        for (auto i = size() - 1; i >= 0; --i)
            result.push_back(_entries[i]);
        return result;
    }

    // equality
public:
    /// True iff both dictionaries hold the same (key, value) pairs, in any order.
    /// Values are compared with ac::structural_equal.
    [[nodiscard]] bool equals(assoc_dict const& rhs) const
        requires ac::equality_comparable<V>
    {
        if (size() != rhs.size())
            return false;

        // keys are unique on both sides, so equal sizes + inclusion is set equality
        for (auto const& e : _entries)
        {
            auto const v = rhs.find(e.first);
            if (v == nullptr || !ac::structural_equal{}(*v, e.second))
                return false;
        }
        return true;
    }

    [[nodiscard]] friend bool operator==(assoc_dict const& lhs, assoc_dict const& rhs)
        requires ac::equality_comparable<V>
    {
        return lhs.equals(rhs);
    }

    /// Same entries in the same recency order.
    /// Not a semantic equality, mostly useful for tests of ordering behavior.
    [[nodiscard]] bool same_order_as(assoc_dict const& rhs) const
        requires ac::equality_comparable<V>
    {
        if (size() != rhs.size())
            return false;
        for (isize i = 0; i < size(); ++i)
        {
            if (!key_equal(_entries[i].first, rhs._entries[i].first))
                return false;
            if (!ac::structural_equal{}(_entries[i].second, rhs._entries[i].second))
                return false;
        }
        return true;
    }

    // single-key updates
public:
    /// Returns a dictionary where key maps to value at the most-recent position.
    /// An existing entry with an equal key is dropped from its old position.
    [[nodiscard]] assoc_dict insert(K key, V value) const
    {
        auto result = assoc_dict::with_capacity(size() + 1);
        for (auto const& e : _entries)
            if (!key_equal(e.first, key))
                result._entries.push_back(e);
        result._entries.push_back(entry_t{ac::move(key), ac::move(value)});
        return result;
    }

    /// Like insert(), but if key is present the new value is combine(new_value, old_value).
    template <class F>
    [[nodiscard]] assoc_dict insert_with(K key, V value, F&& combine) const
    {
        static_assert(ac::is_invocable_r<V, F&, V const&, V const&>, "combine must be callable as V(V const& new, V const& old)");

        if (auto const old = find(key))
            value = ac::invoke(combine, static_cast<V const&>(value), *old);
        return insert(ac::move(key), ac::move(value));
    }

    /// Replaces the value of key by f(old_value), keeping its position.
    /// Absent keys leave the content unchanged.
    template <class F>
    [[nodiscard]] assoc_dict adjust(K const& key, F&& f) const
    {
        static_assert(ac::is_invocable_r<V, F&, V const&>, "f must be callable as V(V const&)");

        auto result = *this;
        auto const idx = index_of(key);
        if (idx >= 0)
            result._entries[idx].second = ac::invoke(f, _entries[idx].second);
        return result;
    }

    /// Returns a dictionary without the entry for key.
    /// Absent keys leave the content unchanged.
    [[nodiscard]] assoc_dict remove(K const& key) const
    {
        auto result = assoc_dict::with_capacity(size());
        for (auto const& e : _entries)
            if (!key_equal(e.first, key))
                result._entries.push_back(e);
        return result;
    }

    // set algebra
public:
    /// All entries of this, plus the entries of rhs whose key is not in this.
    /// On collision the entry of this wins and keeps its position.
    /// The entries of this are more recent than the ones taken from rhs.
    [[nodiscard]] assoc_dict union_with(assoc_dict const& rhs) const
    {
        auto result = assoc_dict::with_capacity(size() + rhs.size());
        for (auto const& e : rhs._entries)
            if (!contains(e.first))
                result._entries.push_back(e);
        for (auto const& e : _entries)
            result._entries.push_back(e);
        return result;
    }

    /// Entries of this whose key is in rhs. Values and order come from this.
    [[nodiscard]] assoc_dict intersect_with(assoc_dict const& rhs) const
    {
        auto result = assoc_dict::with_capacity(size());
        for (auto const& e : _entries)
            if (rhs.contains(e.first))
                result._entries.push_back(e);
        return result;
    }

    /// Entries of this whose key is not in rhs. Values and order come from this.
    [[nodiscard]] assoc_dict diff_with(assoc_dict const& rhs) const
    {
        auto result = assoc_dict::with_capacity(size());
        for (auto const& e : _entries)
            if (!rhs.contains(e.first))
                result._entries.push_back(e);
        return result;
    }

    // traversal
public:
    /// Folds from the most recent entry to the least recent one.
    /// f is called as f(acc, key, value) and returns the new accumulator.
    template <class F, class Acc>
    [[nodiscard]] Acc foldl(F&& f, Acc init) const
    {
        for (auto i = size() - 1; i >= 0; --i)
            init = ac::invoke(f, ac::move(init), _entries[i].first, _entries[i].second);
        return init;
    }

    /// Folds from the least recent entry to the most recent one.
    /// f is called as f(key, value, acc) and returns the new accumulator.
    template <class F, class Acc>
    [[nodiscard]] Acc foldr(F&& f, Acc init) const
    {
        for (auto const& e : _entries)
            init = ac::invoke(f, e.first, e.second, ac::move(init));
        return init;
    }

    /// Entries for which pred(key, value) holds, in their original order.
    [[nodiscard]] assoc_dict filter(ac::function_ref<bool(K const&, V const&)> pred) const
    {
        auto result = assoc_dict::with_capacity(size());
        for (auto const& e : _entries)
            if (pred(e.first, e.second))
                result._entries.push_back(e);
        return result;
    }

    /// Splits into (entries satisfying pred, entries not satisfying pred), both in original order.
    [[nodiscard]] ac::pair<assoc_dict, assoc_dict> partition(ac::function_ref<bool(K const&, V const&)> pred) const
    {
        ac::pair<assoc_dict, assoc_dict> result;
        for (auto const& e : _entries)
        {
            if (pred(e.first, e.second))
                result.first._entries.push_back(e);
            else
                result.second._entries.push_back(e);
        }
        return result;
    }

    /// Same keys in the same order, values replaced by f(value).
    template <class F>
    [[nodiscard]] auto map_values(F&& f) const
    {
        using result_value_t = std::remove_cvref_t<ac::invoke_result<F&, V const&>>;

        auto result = assoc_dict<K, result_value_t>::with_capacity(size());
        for (auto const& e : _entries)
            result._entries.push_back({e.first, ac::invoke(f, e.second)});
        return result;
    }

    assoc_dict() = default;

private:
    [[nodiscard]] static bool key_equal(K const& a, K const& b) { return ac::structural_equal{}(a, b); }

    [[nodiscard]] static assoc_dict with_capacity(isize capacity)
    {
        assoc_dict d;
        d._entries.reserve(capacity);
        return d;
    }

    // index into _entries or -1
    [[nodiscard]] isize index_of(K const& key) const
    {
        for (isize i = 0; i < _entries.size(); ++i)
            if (key_equal(_entries[i].first, key))
                return i;
        return -1;
    }

    // only used while building a fresh result that is not observable yet
    void insert_in_place(K const& key, V const& value)
    {
        auto const idx = index_of(key);
        if (idx >= 0)
            _entries.remove_at(idx);
        _entries.push_back(entry_t{key, value});
    }

    template <class, class>
    friend struct ac::assoc_dict;

    // oldest entry first, most recent entry last
    ac::vector<entry_t> _entries;
};

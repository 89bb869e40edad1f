#pragma once

#include <assoc-core/assoc_dict.hh>
#include <assoc-core/function_ref.hh>
#include <assoc-core/fwd.hh>
#include <assoc-core/span.hh>
#include <assoc-core/unit.hh>
#include <assoc-core/utility.hh>
#include <assoc-core/vector.hh>

#include <type_traits>


/// Set of K that only requires structural equality on K.
///
/// Thin projection of ac::assoc_dict<K, ac::unit>: each operation forwards to exactly one
/// dictionary operation, synthesizing or dropping the unit payload.
/// Ordering, complexity and value semantics are the dictionary's (see assoc_dict.hh):
/// to_list() and foldl() observe most-recent-first, foldr() least-recent-first.
///
/// Usage:
///   auto s = ac::assoc_set<int>::create_from_list({3, 1, 2, 3});
///   s.to_list();                         // [3, 1, 2]
///   s.insert(4).contains(4);             // true
///   s.filter([](int const& x) { return x > 1; });
template <class K>
struct ac::assoc_set
{
    using element_t = K;
    using dict_t = ac::assoc_dict<K, ac::unit>;

    // factories
public:
    [[nodiscard]] static assoc_set create_empty() { return {}; }

    [[nodiscard]] static assoc_set create_singleton(K element)
    {
        return assoc_set(dict_t::create_singleton(ac::move(element), ac::unit{}));
    }

    /// Inserts the elements from right to left (fold-right).
    /// Duplicates collapse; the leftmost occurrence is inserted last and becomes the most recent:
    ///   create_from_list({3, 1, 2, 3}).to_list() == [3, 1, 2]
    [[nodiscard]] static assoc_set create_from_list(ac::span<K const> list)
    {
        auto entries = ac::vector<typename dict_t::entry_t>::create_with_capacity(list.size());
        for (auto const& e : list)
            entries.push_back({e, ac::unit{}});
        return assoc_set(dict_t::create_from_list(entries));
    }

    // queries
public:
    [[nodiscard]] bool empty() const { return _dict.empty(); }
    [[nodiscard]] isize size() const { return _dict.size(); }
    [[nodiscard]] bool contains(K const& element) const { return _dict.contains(element); }

    /// Elements, most-recent-first.
    [[nodiscard]] ac::vector<K> to_list() const { return _dict.keys(); }

    /// True iff every element of this set is in rhs.
    [[nodiscard]] bool is_subset_of(assoc_set const& rhs) const { return _dict.diff_with(rhs._dict).empty(); }

    /// The underlying dictionary (all values are ac::unit).
    [[nodiscard]] dict_t const& dict() const { return _dict; }

    // equality
public:
    /// Same elements, in any order.
    [[nodiscard]] bool equals(assoc_set const& rhs) const { return _dict.equals(rhs._dict); }

    [[nodiscard]] friend bool operator==(assoc_set const& lhs, assoc_set const& rhs) { return lhs.equals(rhs); }

    // single-element updates
public:
    /// The element becomes the most recent one, also if it was already present.
    [[nodiscard]] assoc_set insert(K element) const { return assoc_set(_dict.insert(ac::move(element), ac::unit{})); }

    [[nodiscard]] assoc_set remove(K const& element) const { return assoc_set(_dict.remove(element)); }

    // set algebra
public:
    /// Elements of this first (most recent), then the elements of rhs not in this.
    [[nodiscard]] assoc_set union_with(assoc_set const& rhs) const { return assoc_set(_dict.union_with(rhs._dict)); }

    /// Elements of this that are in rhs, in the order of this.
    [[nodiscard]] assoc_set intersect_with(assoc_set const& rhs) const
    {
        return assoc_set(_dict.intersect_with(rhs._dict));
    }

    /// Elements of this that are not in rhs, in the order of this.
    [[nodiscard]] assoc_set diff_with(assoc_set const& rhs) const { return assoc_set(_dict.diff_with(rhs._dict)); }

    // traversal
public:
    /// Folds most-recent-first, f(acc, element) returns the new accumulator.
    template <class F, class Acc>
    [[nodiscard]] Acc foldl(F&& f, Acc init) const
    {
        return _dict.foldl([&](Acc acc, K const& element, ac::unit const&) -> Acc
                           { return ac::invoke(f, ac::move(acc), element); },
                           ac::move(init));
    }

    /// Folds least-recent-first, f(element, acc) returns the new accumulator.
    template <class F, class Acc>
    [[nodiscard]] Acc foldr(F&& f, Acc init) const
    {
        return _dict.foldr([&](K const& element, ac::unit const&, Acc acc) -> Acc
                           { return ac::invoke(f, element, ac::move(acc)); },
                           ac::move(init));
    }

    /// Image set {f(x) | x in this}.
    ///
    /// The images are listed least-recent-first (the list obtained by prepending f(x) while folding
    /// most-recent-first) and then passed to create_from_list.
    /// NOTE: for a non-injective f this fixes which duplicate image wins the more recent position.
    ///       Treat that order as incidental and compare results with == unless order is the point.
    template <class F>
    [[nodiscard]] auto map(F&& f) const
    {
        using result_t = std::remove_cvref_t<ac::invoke_result<F&, K const&>>;

        auto images = _dict.foldr(
            [&](K const& element, ac::unit const&, ac::vector<result_t> acc) -> ac::vector<result_t>
            {
                acc.push_back(ac::invoke(f, element));
                return acc;
            },
            ac::vector<result_t>::create_with_capacity(size()));

        return ac::assoc_set<result_t>::create_from_list(images);
    }

    /// Elements for which pred holds, in their original order.
    [[nodiscard]] assoc_set filter(ac::function_ref<bool(K const&)> pred) const
    {
        return assoc_set(_dict.filter([&](K const& element, ac::unit const&) { return pred(element); }));
    }

    /// Splits into (elements satisfying pred, elements not satisfying pred), both in original order.
    [[nodiscard]] ac::pair<assoc_set, assoc_set> partition(ac::function_ref<bool(K const&)> pred) const
    {
        auto [yes, no] = _dict.partition([&](K const& element, ac::unit const&) { return pred(element); });
        return {assoc_set(ac::move(yes)), assoc_set(ac::move(no))};
    }

    assoc_set() = default;

private:
    explicit assoc_set(dict_t dict) : _dict(ac::move(dict)) {}

    dict_t _dict;
};

#pragma once

#include <assoc-core/fwd.hh>
#include <assoc-core/utility.hh>

#include <cstddef>
#include <type_traits>
#include <utility>

/// Entry type of ac::assoc_dict (first = key, second = value) and result of partition().
/// Plain aggregate with structured binding support:
///   for (auto const& [key, value] : d.entries()) ...
///   auto [matching, rest] = s.partition(pred);
template <class T, class U>
struct ac::pair
{
    T first;
    U second;

    // member-wise, only exists if both members have operator==
    [[nodiscard]] friend constexpr bool operator==(pair const&, pair const&) = default;

    template <std::size_t I, class P>
        requires(std::is_same_v<std::remove_cvref_t<P>, pair> && I < 2)
    [[nodiscard]] friend constexpr decltype(auto) get(P&& p) noexcept
    {
        if constexpr (I == 0)
            return (ac::forward<P>(p).first);
        else
            return (ac::forward<P>(p).second);
    }
};

template <class T, class U>
struct std::tuple_size<ac::pair<T, U>> : std::integral_constant<std::size_t, 2>
{
};

template <std::size_t I, class T, class U>
struct std::tuple_element<I, ac::pair<T, U>>
{
    static_assert(I < 2, "ac::pair has two elements");
    using type = std::conditional_t<I == 0, T, U>;
};

#pragma once

#include <assoc-core/fwd.hh>

#include <concepts>

// =========================================================================================================
// Structural equality
// =========================================================================================================
//
// The only capability the association containers need from keys (and, for dictionary
// equality, from values). No hash and no ordering is ever required.
//
//   ac::equality_traits<T>       - customization point, defaults to operator==
//   ac::structural_equal         - function object dispatching to equality_traits
//   ac::equality_comparable<T>   - concept checked by assoc_dict / assoc_set
//
// Customization for a type without operator== (or whose operator== is not the wanted notion):
//
//   template <>
//   struct ac::equality_traits<my_record>
//   {
//       static bool equals(my_record const& a, my_record const& b) { return a.id == b.id; }
//   };
//
// The relation must be reflexive, symmetric and transitive. This is not checked.

namespace ac
{
template <class T>
struct equality_traits
{
    [[nodiscard]] static constexpr bool equals(T const& a, T const& b)
        requires requires {
            { a == b } -> std::convertible_to<bool>;
        }
    {
        return static_cast<bool>(a == b);
    }
};

template <class T>
concept equality_comparable = requires(T const& a, T const& b) {
    { equality_traits<T>::equals(a, b) } -> std::convertible_to<bool>;
};

/// Compares two values with equality_traits<T>
/// Usage:
///   ac::structural_equal{}(a, b);
struct structural_equal
{
    template <equality_comparable T>
    [[nodiscard]] constexpr bool operator()(T const& a, T const& b) const
    {
        return equality_traits<T>::equals(a, b);
    }
};
} // namespace ac

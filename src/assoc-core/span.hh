#pragma once

#include <assoc-core/assert.hh>
#include <assoc-core/fwd.hh>

#include <concepts>
#include <cstddef>
#include <initializer_list>
#include <type_traits>

/// Pointer + size view over contiguous T, the input type of the create_from_list factories.
/// Implicitly constructible from braced lists (T const only), C arrays and anything with data() and size(),
/// so all of these work:
///   ac::assoc_set<int>::create_from_list({3, 1, 2, 3});
///   ac::assoc_set<int>::create_from_list(other.to_list());
///   ac::assoc_dict<int, char>::create_from_list(d.entries());
///
/// Always trivially copyable. A span never owns and never extends lifetimes.
template <class T>
struct ac::span
{
public:
    constexpr span() = default;

    constexpr explicit span(T* ptr, isize size) : _data(ptr), _size(size)
    {
        AC_ASSERT(size >= 0, "span size must be non-negative");
    }

    constexpr explicit span(T* begin, T* end) : _data(begin), _size(end - begin)
    {
        AC_ASSERT(begin <= end, "invalid pointer range");
    }

    /// the list dies at the end of the full expression, only use this for arguments
    constexpr span(std::initializer_list<std::remove_const_t<T>> init)
        requires std::is_const_v<T>
      : _data(init.begin()), _size(static_cast<isize>(init.size()))
    {
    }

    template <std::size_t N>
    constexpr span(T (&arr)[N]) : _data(arr), _size(static_cast<isize>(N))
    {
    }

    template <class Container>
        requires(!std::is_same_v<std::remove_cvref_t<Container>, span>) && requires(Container&& c) {
            { c.data() } -> std::convertible_to<T*>;
            { c.size() } -> std::convertible_to<isize>;
        }
    constexpr span(Container&& c) : _data(c.data()), _size(static_cast<isize>(c.size())) // NOLINT
    {
    }

    // access
public:
    [[nodiscard]] constexpr T& operator[](isize i) const
    {
        AC_ASSERT(0 <= i && i < _size, "index out of bounds");
        return _data[i];
    }

    [[nodiscard]] constexpr T& front() const
    {
        AC_ASSERT(_size > 0, "front() called on empty span");
        return _data[0];
    }

    [[nodiscard]] constexpr T& back() const
    {
        AC_ASSERT(_size > 0, "back() called on empty span");
        return _data[_size - 1];
    }

    [[nodiscard]] constexpr T* data() const { return _data; }
    [[nodiscard]] constexpr T* begin() const { return _data; }
    [[nodiscard]] constexpr T* end() const { return _data + _size; }

    [[nodiscard]] constexpr isize size() const { return _size; }
    [[nodiscard]] constexpr bool empty() const { return _size == 0; }

private:
    T* _data = nullptr;
    isize _size = 0;
};

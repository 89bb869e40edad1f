#pragma once

#include <assoc-core/macros.hh>

#include <functional>
#include <type_traits>

// Small vocabulary helpers, so the container headers do not pull in <utility> / <algorithm>.
//
//   ac::move(x), ac::forward<T>(x), ac::exchange(obj, v)
//   ac::max(a, b)
//   ac::invoke(f, args...), ac::is_invocable_r<R, F, Args...>, ac::invoke_result<F, Args...>
//   ac::function_ptr<R(Args...)>  ->  R (*)(Args...)

namespace ac
{
template <class T>
[[nodiscard]] AC_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] AC_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] AC_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Assigns new_val to obj and returns the previous value.
///   _start = ac::exchange(rhs._start, nullptr);
template <class T, class U = T>
[[nodiscard]] AC_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = ac::forward<U>(new_val);
    return old_val;
}

/// b if neither is larger
template <class T>
[[nodiscard]] constexpr T const& max(T const& a, T const& b)
{
    return (b < a) ? a : b; // NOLINT(bugprone-return-const-ref-from-parameter)
}

/// Calls lambdas, functors, function pointers and member pointers uniformly.
///   acc = ac::invoke(f, ac::move(acc), key, value);
template <class F, class... Args>
constexpr decltype(auto) invoke(F&& f, Args&&... args) noexcept(std::is_nothrow_invocable_v<F, Args...>)
{
    return std::invoke(ac::forward<F>(f), ac::forward<Args>(args)...);
}

template <class R, class F, class... Args>
constexpr bool is_invocable_r = std::is_invocable_r_v<R, F, Args...>;

template <class F, class... Args>
using invoke_result = std::invoke_result_t<F, Args...>;

template <class... E>
constexpr bool always_false_t = false;

namespace impl
{
template <class T>
struct function_ptr_t
{
    static_assert(always_false_t<T>, "function_ptr expects a function signature R(Args...)");
};
template <class R, class... Args>
struct function_ptr_t<R(Args...)>
{
    using type = R (*)(Args...);
};
} // namespace impl

template <class T>
using function_ptr = typename impl::function_ptr_t<T>::type;
} // namespace ac

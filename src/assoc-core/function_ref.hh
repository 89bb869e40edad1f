#pragma once

#include <assoc-core/assert.hh>
#include <assoc-core/fwd.hh>
#include <assoc-core/utility.hh>

#include <type_traits>

/// Borrowed callable with the fixed signature R(Args...), two pointers wide.
/// Parameter type of the filter / partition predicates of ac::assoc_dict and ac::assoc_set.
///
/// Does not own: the callable has to outlive every call.
/// A lambda written directly in the argument list is alive for the whole call:
///   auto odd = s.filter([](int const& x) { return x % 2 == 1; });
/// Storing a function_ref to a temporary is a dangling reference.
///
/// Binds anything ac::invoke accepts: lambdas, functors, function pointers, member pointers.
/// A default constructed function_ref is unbound and must not be called.
template <class R, class... Args>
struct ac::function_ref<R(Args...)>
{
public:
    function_ref() = default;

    template <class F>
        requires(!std::is_same_v<std::remove_cvref_t<F>, function_ref>)
    function_ref(F&& f) : _payload(const_cast<void*>(static_cast<void const*>(&f)))
    {
        static_assert(ac::is_invocable_r<R, F&, Args...>, "callable does not match the function_ref signature");

        using callable_t = std::remove_reference_t<F>;
        _thunk = [](void* payload, Args... args) -> R // NOLINT
        { return ac::invoke(*static_cast<callable_t*>(payload), ac::forward<Args>(args)...); };
    }

    [[nodiscard]] bool is_valid() const { return _thunk != nullptr; }
    [[nodiscard]] explicit operator bool() const { return _thunk != nullptr; }

    /// precondition: is_valid()
    R operator()(Args... args) const
    {
        AC_ASSERT(_thunk != nullptr, "calling invalid function_ref is UB");
        return _thunk(_payload, ac::forward<Args>(args)...);
    }

private:
    void* _payload = nullptr;
    ac::function_ptr<R(void*, Args...)> _thunk = nullptr;
};

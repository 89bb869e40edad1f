#pragma once

// Included by every container header, so it stays small.
// Formatted messages live in <assoc-core/assertf.hh>, custom handlers in <assoc-core/assert-handler.hh>.
#include <assoc-core/macros.hh>
#include <assoc-core/source_location.hh>

// =========================================================================================================
// Contract checks
// =========================================================================================================
//
// AC_ASSERT(cond, "message")
//   Active when AC_ASSERT_ENABLED is 1 (debug and relwithdebinfo builds by default).
//   In other builds cond and message are type-checked but never evaluated.
//
// AC_ASSERT_ALWAYS(cond, "message")
//   Same, but active in every build.
//
// A failed check reports expression, message and source location to the innermost assertion
// handler (stderr plus stacktrace if none is installed), breaks into an attached debugger and aborts.
//
// Only programmer errors are asserted: indices out of range, negative capacities,
// calling an unbound function_ref. The association containers themselves
// have no failing operations: remove of an absent key, filter without matches, etc. are no-ops.
//
// Usage:
//   AC_ASSERT(0 <= i && i < size(), "index out of bounds");
//
#define AC_ASSERT(cond, msg) AC_IMPL_ASSERT(cond, msg)

#define AC_ASSERT_ALWAYS(cond, msg) AC_IMPL_ASSERT_ALWAYS(cond, msg)

// breaks only if a debugger is attached
#define AC_DEBUG_BREAK() AC_IMPL_DEBUG_BREAK()

#define AC_BREAK_AND_ABORT() (AC_DEBUG_BREAK(), ::ac::impl::perform_abort())


// =========================================================================================================
// Implementation details
// =========================================================================================================

namespace ac::impl
{
// reports to the handler stack, the caller aborts afterwards
AC_COLD_FUNC void handle_assert_failure(char const* expression, char const* message, ac::source_location location);

bool is_debugger_connected() noexcept;

[[noreturn]] void perform_abort() noexcept;
} // namespace ac::impl

// the break has to happen inside the macro so the debugger stops at the failing line

#if defined(AC_COMPILER_MSVC)

#define AC_IMPL_DEBUG_BREAK() (::ac::impl::is_debugger_connected() ? __debugbreak() : void(0))

#else

// 5 is SIGTRAP, declared by hand to keep <csignal> out of every header
extern "C" int raise(int) noexcept;
#define AC_IMPL_DEBUG_BREAK() (::ac::impl::is_debugger_connected() ? (void)::raise(5) : void(0))

#endif

#define AC_IMPL_ASSERT_ALWAYS(cond, msg)                                                     \
    do                                                                                       \
    {                                                                                        \
        if (!(cond)) [[unlikely]]                                                            \
        {                                                                                    \
            ::ac::impl::handle_assert_failure(#cond, msg, ::ac::source_location::current()); \
            AC_BREAK_AND_ABORT();                                                            \
        }                                                                                    \
    } while (false)

#if AC_ASSERT_ENABLED
#define AC_IMPL_ASSERT(cond, msg) AC_IMPL_ASSERT_ALWAYS(cond, msg)
#else
#define AC_IMPL_ASSERT(cond, msg) \
    do                            \
    {                             \
        AC_UNUSED(cond);          \
        AC_UNUSED(msg);           \
    } while (false)
#endif

#pragma once

#include <assoc-core/assert.hh>

#include <format>
#include <string>

// AC_ASSERTF(cond, "fmt {}", args...) and AC_ASSERTF_ALWAYS(cond, "fmt {}", args...)
//
// AC_ASSERT / AC_ASSERT_ALWAYS with a std::format message.
// The arguments are formatted on failure only, passing checks pay for the condition alone.
//
//   AC_ASSERTF(idx < size(), "index {} out of bounds (size: {})", idx, size());
//
#define AC_ASSERTF(cond, msg, ...) AC_IMPL_ASSERTF(cond, msg __VA_OPT__(, ) __VA_ARGS__)
#define AC_ASSERTF_ALWAYS(cond, msg, ...) AC_IMPL_ASSERTF_ALWAYS(cond, msg __VA_OPT__(, ) __VA_ARGS__)

#define AC_IMPL_ASSERTF_ALWAYS(cond, msg, ...)                                                            \
    do                                                                                                    \
    {                                                                                                     \
        if (!(cond)) [[unlikely]]                                                                         \
        {                                                                                                 \
            ::ac::impl::handle_assert_failure(#cond, std::format(msg __VA_OPT__(, ) __VA_ARGS__).c_str(), \
                                              ::ac::source_location::current());                          \
            AC_BREAK_AND_ABORT();                                                                         \
        }                                                                                                 \
    } while (false)

#if AC_ASSERT_ENABLED
#define AC_IMPL_ASSERTF(cond, msg, ...) AC_IMPL_ASSERTF_ALWAYS(cond, msg __VA_OPT__(, ) __VA_ARGS__)
#else
// the format string is still checked at compile time
#define AC_IMPL_ASSERTF(cond, msg, ...)                         \
    do                                                          \
    {                                                           \
        AC_UNUSED(cond);                                        \
        AC_UNUSED(std::format(msg __VA_OPT__(, ) __VA_ARGS__)); \
    } while (false)
#endif

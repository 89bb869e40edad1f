#pragma once

#include <assoc-core/macros.hh>
#include <assoc-core/source_location.hh>

#include <functional>
#include <string>

// Stack of assertion handlers, innermost first.
// Without any handler a failure is printed to stderr together with a stacktrace.
// A handler may throw to unwind out of the failing call (used by the tests),
// if it returns normally the process still aborts.
//
// The stack is process-global and not synchronized.
//
//   auto const guard = ac::impl::scoped_assertion_handler([&](ac::impl::assertion_info const& info) {
//       failures.push_back(info.message);
//       throw check_failed{};
//   });

namespace ac::impl
{
struct assertion_info
{
    std::string expression;
    std::string message;
    ac::source_location location;
};

void push_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);

// precondition: a handler was pushed
void pop_assertion_handler();

// pushes in the constructor, pops in the destructor
struct scoped_assertion_handler
{
    explicit scoped_assertion_handler(std::move_only_function<void(assertion_info const&)> handler);
    ~scoped_assertion_handler();

    scoped_assertion_handler(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler const&) = delete;
    scoped_assertion_handler(scoped_assertion_handler&&) = delete;
    scoped_assertion_handler& operator=(scoped_assertion_handler&&) = delete;
};
} // namespace ac::impl

#pragma once

#include <stacktrace>

namespace ac
{
/// Snapshot of the call stack, printed by the default assertion handler
/// Usage:
///   auto trace = ac::stacktrace::current();
///   std::cerr << std::to_string(trace);
using stacktrace = std::stacktrace;
} // namespace ac

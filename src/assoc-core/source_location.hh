#pragma once

#include <source_location>

namespace ac
{
/// Source code position (file, line, column, function) captured by assertions
/// Usage:
///   void trace(ac::source_location loc = ac::source_location::current());
using source_location = std::source_location;
} // namespace ac

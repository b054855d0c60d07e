#pragma once

#include <source_location>

namespace sk
{
/// Type alias for std::source_location
/// Captured by the assertion macros and handed to assertion handlers
/// Usage:
///   void trace(sk::source_location loc = sk::source_location::current()) {
///       std::cerr << loc.file_name() << ":" << loc.line();
///   }
using source_location = std::source_location;
} // namespace sk

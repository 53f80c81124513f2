#pragma once

#include <source_location>

namespace oc
{
/// Type alias for std::source_location
/// Captured by every assertion so failures report file, line, column and function
using source_location = std::source_location;
} // namespace oc

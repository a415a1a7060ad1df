#pragma once

#include <source_location>

namespace nsrb
{
/// Location of a failed assertion (file, line, column, function)
using source_location = std::source_location;
} // namespace nsrb

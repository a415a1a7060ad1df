#pragma once

#include <nsrb/fwd.hh>

// =========================================================================================================
// Capacity limits
// =========================================================================================================
//
// Every buffer lives on the stack, so its capacity is bounded:
//   NSRB_LOWER_LIMIT  - smallest checked capacity (default 2, a ring of 1 can never hold an element)
//   NSRB_UPPER_LIMIT  - largest checked capacity, and largest index value of an unchecked buffer (default 65535)
//   NSRB_NO_LIMIT     - disables both limits (checked capacities must still be positive)
//
// All three are set from CMake (NSRB_LOWER_LIMIT, NSRB_UPPER_LIMIT, NSRB_NO_LIMIT options).
// A buffer outside the limits is not a valid type: it fails to compile instead of failing at runtime.
//

#ifndef NSRB_LOWER_LIMIT
#define NSRB_LOWER_LIMIT 2
#endif

#ifndef NSRB_UPPER_LIMIT
#define NSRB_UPPER_LIMIT 65535
#endif

namespace nsrb
{
inline constexpr isize lower_limit = NSRB_LOWER_LIMIT;
inline constexpr isize upper_limit = NSRB_UPPER_LIMIT;

#ifdef NSRB_NO_LIMIT
inline constexpr bool limits_enforced = false;
#else
inline constexpr bool limits_enforced = true;
#endif

static_assert(lower_limit >= 1, "NSRB_LOWER_LIMIT must be positive");
static_assert(lower_limit <= upper_limit, "NSRB_LOWER_LIMIT must not exceed NSRB_UPPER_LIMIT");

/// True if a checked buffer may have the given capacity
[[nodiscard]] constexpr bool is_admissible_capacity(isize capacity)
{
    if (capacity < 1)
        return false;

    if constexpr (limits_enforced)
        return lower_limit <= capacity && capacity <= upper_limit;
    else
        return true;
}

/// True if an unchecked buffer may use an index type whose largest value is max_index
/// NOTE: compares the largest index (not the capacity max_index + 1) against upper_limit,
///       so u16 indices are admissible under the default limit of 65535 and u32 indices are not
[[nodiscard]] constexpr bool is_admissible_max_index(isize max_index)
{
    if constexpr (limits_enforced)
        return lower_limit <= max_index + 1 && max_index <= upper_limit;
    else
        return true;
}
} // namespace nsrb

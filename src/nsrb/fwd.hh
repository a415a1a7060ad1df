#pragma once

#include <cstddef>
#include <cstdint>


namespace nsrb
{

//
// Primitives
//

// signed integers
using i8 = int8_t;
using i16 = int16_t;
using i32 = int32_t;
using i64 = int64_t;

// unsigned integers
using u8 = uint8_t;
using u16 = uint16_t;
using u32 = uint32_t;
using u64 = uint64_t;

// signed size type
// Capacities, sizes and checked indices are isize.
// Unchecked buffers keep their head/tail in the (unsigned) index type itself because they rely on its wraparound.
using isize = i64;

//
// Storage
//

struct nullopt_t;
template <class T>
struct optional; // only optional<T&> is provided

template <class T, isize N>
struct fixed_array;

//
// Index policies
//

template <isize N>
struct checked_index;
template <class IndexT>
struct unchecked_index;

// basic_ring and basic_manx are constrained, they are declared in ring.hh and manx.hh

} // namespace nsrb

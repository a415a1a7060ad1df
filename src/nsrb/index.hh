#pragma once

#include <nsrb/fixed_array.hh>
#include <nsrb/fwd.hh>
#include <nsrb/limits.hh>
#include <nsrb/macros.hh>

#include <concepts>
#include <limits>
#include <type_traits>

// =========================================================================================================
// Index policies
// =========================================================================================================
//
// A buffer's storage is a fixed_array<T, capacity>, its cursors are index_t values.
// The policy decides how a cursor moves to the next slot and how a slot is accessed:
//
//   checked_index<N>          - capacity N (any admissible value), isize cursors,
//                               wraps by comparing against N - 1, bounds-asserted slot access
//   unchecked_index<IndexT>   - capacity 2^bits(IndexT), IndexT cursors,
//                               wraps by unsigned overflow, raw slot access
//
// Both buffers (basic_ring, basic_manx) are written once against this interface:
//
//   using index_t;
//   static constexpr isize capacity;
//   static constexpr bool is_admissible;            // within the configured limits
//   static index_t advance(index_t i);              // next slot, wrapping to 0
//   static T& slot(fixed_array<T, capacity>&, index_t i);
//

/// Index policy for buffers of an arbitrary capacity N
template <nsrb::isize N>
struct nsrb::checked_index
{
    using index_t = isize;

    static constexpr isize capacity = N;
    static constexpr bool is_admissible = is_admissible_capacity(N);

    /// Next slot after i: i >= N - 1 wraps to 0
    /// No modulo, N is not necessarily a power of two
    [[nodiscard]] NSRB_FORCE_INLINE static constexpr index_t advance(index_t i) { return i >= N - 1 ? 0 : i + 1; }

    template <class T>
    [[nodiscard]] NSRB_FORCE_INLINE static constexpr T& slot(fixed_array<T, N>& buffer, index_t i)
    {
        return buffer[i];
    }
};

/// Index policy for buffers spanning the full range of an unsigned index type
/// u8 -> 256 slots, u16 -> 65536 slots
/// Every index_t value is a valid slot, so no access is ever out of bounds and none is checked
template <class IndexT>
struct nsrb::unchecked_index
{
    static_assert(std::is_unsigned_v<IndexT> && !std::is_same_v<IndexT, bool>, "index type must be an unsigned integer");
    static_assert(sizeof(IndexT) <= sizeof(u32), "index types wider than 32 bit are not supported");

    using index_t = IndexT;

    static constexpr isize max_index = isize(std::numeric_limits<IndexT>::max());
    static constexpr isize capacity = max_index + 1;
    static constexpr bool is_admissible = is_admissible_max_index(max_index);

    /// Next slot after i, max_index wraps to 0 by overflow
    [[nodiscard]] NSRB_FORCE_INLINE static constexpr index_t advance(index_t i) { return index_t(i + 1u); }

    template <class T>
    [[nodiscard]] NSRB_FORCE_INLINE static constexpr T& slot(fixed_array<T, capacity>& buffer, index_t i)
    {
        return buffer.data()[i];
    }
};

namespace nsrb
{
/// Buffer elements are copied in and out slot by slot, never constructed or destroyed individually
template <class T>
concept buffer_element = std::is_trivially_copyable_v<T> && std::is_default_constructible_v<T>;

template <class P>
concept index_policy = requires(typename P::index_t i) {
    { P::advance(i) } -> std::same_as<typename P::index_t>;
    { P::capacity } -> std::convertible_to<isize>;
    { P::is_admissible } -> std::convertible_to<bool>;
};

/// An index policy within the configured capacity limits
template <class P>
concept admissible_index_policy = index_policy<P> && P::is_admissible;

namespace impl
{
/// Moves lead to its next slot. If lead catches up with trail, trail is pushed one slot ahead too.
/// This is the overwrite-oldest rule of basic_ring::push: head is lead, tail is trail.
/// The slot between them is given up, so a buffer of capacity C holds at most C - 1 elements.
template <class IndexPolicy>
NSRB_FORCE_INLINE constexpr void advance_evicting(typename IndexPolicy::index_t& lead, typename IndexPolicy::index_t& trail)
{
    lead = IndexPolicy::advance(lead);
    if (lead == trail)
        trail = IndexPolicy::advance(trail);
}
} // namespace impl
} // namespace nsrb

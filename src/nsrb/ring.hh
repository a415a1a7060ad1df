#pragma once

#include <nsrb/fixed_array.hh>
#include <nsrb/fwd.hh>
#include <nsrb/index.hh>
#include <nsrb/optional.hh>

namespace nsrb
{
template <class T, class IndexPolicy>
    requires nsrb::buffer_element<T> && nsrb::admissible_index_policy<IndexPolicy>
struct basic_ring;

/// FIFO ring buffer of capacity N, bounds-checked, holds at most N - 1 elements
/// Usage:
///   nsrb::ring<int, 10> rb;
///   rb.push(5);
///   int v = rb.pop().value();
template <class T, isize N>
using ring = basic_ring<T, checked_index<N>>;

/// FIFO ring buffer over the full range of IndexT, cursors wrap by overflow
template <class T, class IndexT>
using unchecked_ring = basic_ring<T, unchecked_index<IndexT>>;

template <class T>
using ring_u8 = unchecked_ring<T, u8>;
template <class T>
using ring_u16 = unchecked_ring<T, u16>;
} // namespace nsrb

/// Fixed-capacity FIFO circular buffer with overwrite-oldest semantics.
///
/// head is the next slot to write, tail the next slot to read, the ring is empty iff head == tail.
/// push never fails: when the ring is full, the oldest unread element is dropped to make room.
/// pop returns a reference into the storage (or nullopt when empty).
///
/// Storage is value-initialized and lives inside the object, there is no allocation.
/// Not synchronized: one reader/writer at a time.
///
/// NOTE: an unchecked ring uses the same head == tail test and the same eviction rule as a checked one,
///       so it holds at most capacity() - 1 elements as well.
template <class T, class IndexPolicy>
    requires nsrb::buffer_element<T> && nsrb::admissible_index_policy<IndexPolicy>
struct nsrb::basic_ring
{
public:
    using index_t = typename IndexPolicy::index_t;

    // construction
public:
    /// Empty ring with zeroed storage, head == tail == 0
    constexpr basic_ring() = default;

    // modification
public:
    /// Writes item at head and advances head.
    /// If head runs into tail, tail advances as well: the oldest unread element is evicted.
    NSRB_FORCE_INLINE constexpr void push(T const& item)
    {
        IndexPolicy::slot(_buffer, _head) = item;
        impl::advance_evicting<IndexPolicy>(_head, _tail);
    }

    /// Removes the oldest element and returns a reference to its slot, or nullopt if the ring is empty.
    /// The reference is only valid until the next push that wraps around to this slot.
    NSRB_FORCE_INLINE constexpr optional<T&> pop()
    {
        if (_tail == _head)
            return nullopt;

        auto const oldest = _tail;
        _tail = IndexPolicy::advance(_tail);
        return IndexPolicy::slot(_buffer, oldest);
    }

    /// Drops all elements in O(1) by moving tail to head.
    /// Storage is not zeroed, the old values remain in buffer() until overwritten.
    constexpr void clear() { _tail = _head; }

    // queries
public:
    /// Number of elements pop() would return before the ring is empty
    [[nodiscard]] constexpr isize size() const
    {
        if (_tail > _head)
            return capacity() + isize(_head) - isize(_tail);
        else
            return isize(_head) - isize(_tail);
    }

    [[nodiscard]] constexpr bool empty() const { return _head == _tail; }

    /// Number of slots, one more than the number of elements the ring can hold
    [[nodiscard]] static constexpr isize capacity() { return IndexPolicy::capacity; }

    /// Next slot to write
    [[nodiscard]] constexpr index_t head() const { return _head; }
    /// Next slot to read
    [[nodiscard]] constexpr index_t tail() const { return _tail; }

    /// Raw storage in slot order, including popped and cleared values
    [[nodiscard]] constexpr fixed_array<T, IndexPolicy::capacity> const& buffer() const { return _buffer; }

    // members
private:
    index_t _tail = 0;
    index_t _head = 0;
    fixed_array<T, IndexPolicy::capacity> _buffer = {};
};

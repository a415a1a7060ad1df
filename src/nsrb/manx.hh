#pragma once

#include <nsrb/fixed_array.hh>
#include <nsrb/fwd.hh>
#include <nsrb/index.hh>

namespace nsrb
{
template <class T, class IndexPolicy>
    requires nsrb::buffer_element<T> && nsrb::admissible_index_policy<IndexPolicy>
struct basic_manx;

/// Manx buffer of capacity N, bounds-checked
template <class T, isize N>
using manx = basic_manx<T, checked_index<N>>;

/// Manx buffer over the full range of IndexT, head wraps by overflow
template <class T, class IndexT>
using unchecked_manx = basic_manx<T, unchecked_index<IndexT>>;

template <class T>
using manx_u8 = unchecked_manx<T, u8>;
template <class T>
using manx_u16 = unchecked_manx<T, u16>;
} // namespace nsrb

/// Ring buffer without a tail: a write-only accumulator of the last capacity() pushes.
/// See https://www.approxion.com/circular-adventures-ix-the-poor-ring-buffer-that-had-no-tail/
///
/// There is nothing to consume, every push overwrites the slot at head and moves on.
/// items() is the whole storage in slot order, NOT in push order:
/// the oldest value sits at head(), the newest just before it.
template <class T, class IndexPolicy>
    requires nsrb::buffer_element<T> && nsrb::admissible_index_policy<IndexPolicy>
struct nsrb::basic_manx
{
public:
    using index_t = typename IndexPolicy::index_t;

    constexpr basic_manx() = default;

    NSRB_FORCE_INLINE constexpr void push(T const& item)
    {
        IndexPolicy::slot(_buffer, _head) = item;
        _head = IndexPolicy::advance(_head);
    }

    [[nodiscard]] constexpr fixed_array<T, IndexPolicy::capacity> const& items() const { return _buffer; }

    [[nodiscard]] constexpr index_t head() const { return _head; }

    [[nodiscard]] static constexpr isize capacity() { return IndexPolicy::capacity; }

private:
    index_t _head = 0;
    fixed_array<T, IndexPolicy::capacity> _buffer = {};
};

#pragma once

#include <nsrb/assert.hh>
#include <nsrb/fwd.hh>


/// Fixed-size array of exactly N elements of type T, the backing storage of every nsrb buffer.
/// Trivial aggregate type: fixed_array<int, 3> arr = {1, 2, 3}; fixed_array<int, 3> zeroed = {};
/// Owns the underlying memory, lives wherever its owner lives (typically the stack).
/// operator[] is bounds-asserted; data() gives unchecked access for the unchecked buffers.
template <class T, nsrb::isize N>
struct nsrb::fixed_array
{
    static_assert(N > 0, "fixed_array size must be positive");

    // members
public:
    T _data[N];

    // element access
public:
    /// Returns a reference to the element at index i.
    /// Precondition: 0 <= i < N.
    [[nodiscard]] constexpr T& operator[](isize i)
    {
        NSRB_ASSERT(0 <= i && i < N, "index out of bounds");
        return _data[i];
    }
    [[nodiscard]] constexpr T const& operator[](isize i) const
    {
        NSRB_ASSERT(0 <= i && i < N, "index out of bounds");
        return _data[i];
    }

    /// Returns a pointer to the underlying contiguous storage.
    [[nodiscard]] constexpr T* data() { return _data; }
    [[nodiscard]] constexpr T const* data() const { return _data; }

    // iterators
public:
    [[nodiscard]] constexpr T* begin() { return _data; }
    [[nodiscard]] constexpr T* end() { return _data + N; }
    [[nodiscard]] constexpr T const* begin() const { return _data; }
    [[nodiscard]] constexpr T const* end() const { return _data + N; }

    // queries
public:
    /// Returns the compile-time size N.
    [[nodiscard]] constexpr isize size() const { return N; }
};

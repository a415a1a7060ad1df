#pragma once

#include <nsrb/assert.hh>
#include <nsrb/fwd.hh>

#include <type_traits>

/// Sentinel type used to represent the "no value" state in optional.
/// Deliberately lacks a default constructor to avoid ambiguity in optional<T&> = {}.
struct nsrb::nullopt_t
{
    enum class _ctor_tag // NOLINT(readability-identifier-naming)
    {
        tag
    };
    explicit constexpr nullopt_t(_ctor_tag) {}
};

namespace nsrb
{
/// The canonical instance of nullopt_t.
/// Usage: if (ring.pop() == nsrb::nullopt) ...
constexpr nullopt_t nullopt = nullopt_t{nullopt_t::_ctor_tag::tag};
} // namespace nsrb

/// Nullable reference to a T, the result of basic_ring::pop().
/// Holds a pointer into the buffer's storage: the referenced slot stays valid only until the next mutation
/// of the buffer it came from (the slot is overwritten once enough pushes wrap around to it).
/// No operator* or operator->; use has_value() and value().
/// Always trivially copyable.
template <class T>
struct nsrb::optional<T&>
{
    // construction
public:
    /// Default optional is empty: has_value() == false.
    constexpr optional() = default;

    /// Constructs an empty optional from nsrb::nullopt.
    constexpr optional(nullopt_t) {}

    /// Constructs an optional referring to value.
    constexpr optional(T& value) : _ptr(&value) {}

    // queries and access
public:
    /// Returns true if this optional refers to a value, false if empty.
    [[nodiscard]] constexpr bool has_value() const { return _ptr != nullptr; }

    /// Returns the referenced value.
    /// Precondition: has_value() == true.
    [[nodiscard]] constexpr T& value() const
    {
        NSRB_ASSERT(_ptr != nullptr, "attempted to access value of empty optional");
        return *_ptr;
    }

    // comparison
public:
    /// Equal if the optional refers to a value that compares equal to rhs.
    /// Returns false if the optional is empty.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, std::remove_cv_t<T> const& rhs)
        requires requires(T const& v) { bool(v == v); }
    {
        return lhs._ptr != nullptr && *lhs._ptr == rhs;
    }

    /// Equal to nullopt iff empty.
    [[nodiscard]] friend constexpr bool operator==(optional const& lhs, nullopt_t) { return lhs._ptr == nullptr; }

    /// Deleted when T is not bool to prevent optional<int&> from comparing with true/false.
    [[nodiscard]] bool operator==(bool) const
        requires(!std::is_same_v<std::remove_cv_t<T>, bool>)
    = delete;

    // members
private:
    T* _ptr = nullptr;
};

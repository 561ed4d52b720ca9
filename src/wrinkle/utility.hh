#pragma once

#include <wrinkle/macros.hh>

// =========================================================================================================
// Utility functions used throughout the containers
// =========================================================================================================
//
// Move semantics:
//   move(value)                 - cast value to rvalue reference for moving
//   forward<T>(value)           - perfect forwarding for template arguments
//   exchange(obj, new_val)      - replace obj with new_val and return old value
//
// Iterator utilities:
//   sentinel                    - lightweight end-of-range sentinel type
//

namespace wr
{
// =========================================================================================================
// Move semantics
// =========================================================================================================

/// Cast value to rvalue reference to enable move semantics
/// Usage:
///   nodes.create(wr::move(item));
template <class T>
[[nodiscard]] WR_FORCE_INLINE constexpr T&& move(T& value) noexcept
{
    return static_cast<T&&>(value);
}

/// Perfect forwarding for template arguments
/// Preserves value category (lvalue/rvalue) when forwarding arguments
template <class T>
[[nodiscard]] WR_FORCE_INLINE constexpr T&& forward(T& value) noexcept
{
    return static_cast<T&&>(value);
}

template <class T>
[[nodiscard]] WR_FORCE_INLINE constexpr T&& forward(T&& value) noexcept // NOLINT
{
    return static_cast<T&&>(value);
}

/// Replace object with new value and return the old value
/// Usage:
///   auto old = wr::exchange(node.value, wr::move(item)); // set(), returns the replaced element
///   auto id = wr::exchange(_free_head, node_id::none);   // take the whole free list
template <class T, class U = T>
[[nodiscard]] WR_FORCE_INLINE constexpr T exchange(T& obj, U&& new_val) // NOLINT
{
    T old_val = static_cast<T&&>(obj);
    obj = forward<U>(new_val);
    return old_val;
}

// =========================================================================================================
// Iterator utilities
// =========================================================================================================

/// A generic end-of-range sentinel type
/// Usage:
///   struct my_range {
///       my_iterator begin() { return ...; }
///       wr::sentinel end() const { return {}; }
///   };
///   struct my_iterator {
///       bool operator!=(wr::sentinel) const { return is_still_valid(); }
///   };
struct sentinel
{
};

} // namespace wr

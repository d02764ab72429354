// purets/basic/casting.hpp - LLVM-style RTTI casting utilities
//
// Works with any class hierarchy exposing a static `classof` predicate.
//
// Usage:
//   if (isa<CallExpr>(node)) { ... }
//   const auto * call = cast<CallExpr>(node);          // asserts on mismatch
//   if (const auto * m = dyn_cast<MemberExpr>(node)) { ... }  // nullptr on mismatch
//
#pragma once

#include <cassert>
#include <type_traits>

namespace purets
{

namespace detail
{

template <typename T, typename From, typename = void>
struct HasClassof : std::false_type
{
};

template <typename T, typename From>
struct HasClassof<T, From, std::void_t<decltype(T::classof(std::declval<const From *>()))>>
: std::true_type
{
};

template <typename T, typename From>
inline constexpr bool has_classof_v = HasClassof<T, From>::value;

}  // namespace detail

// ============================================================================
// isa<T>
// ============================================================================

/// True if `node` is non-null and of dynamic kind T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline bool isa(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node));
}

// ============================================================================
// cast<T>
// ============================================================================

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(node != nullptr && "cast<T>() called with nullptr");
  assert(isa<T>(node) && "Invalid cast");
  return static_cast<const T *>(node);
}

// ============================================================================
// dyn_cast<T>
// ============================================================================

/// Checked cast; nullptr when `node` is null or of another kind.
template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(node) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace purets

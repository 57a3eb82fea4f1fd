// scssls/basic/casting.hpp - classof-driven casting utilities
//
// Works with any hierarchy whose classes provide a static
// `bool classof(const Base *)`.
//
//   if (isa<cst::Ruleset>(node)) { ... }
//   auto * rule = cast<cst::Ruleset>(node);          // asserts on mismatch
//   if (auto * rule = dyn_cast<cst::Ruleset>(node))  // nullptr on mismatch
//
#pragma once

#include <cassert>
#include <type_traits>
#include <utility>

namespace scssls
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

/// True when `node` is non-null and of type T.
template <typename T, typename From>
[[nodiscard]] inline bool isa(const From * node) noexcept
{
  static_assert(detail::has_classof_v<T, From>, "Target type must have a classof() static method");
  return node != nullptr && T::classof(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * cast(From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline const T * cast(const From * node) noexcept
{
  assert(isa<T>(node) && "cast<T>() on a node of another kind");
  return static_cast<const T *>(node);
}

template <typename T, typename From>
[[nodiscard]] inline T * dyn_cast(From * node) noexcept
{
  return isa<T>(static_cast<const From *>(node)) ? static_cast<T *>(node) : nullptr;
}

template <typename T, typename From>
[[nodiscard]] inline const T * dyn_cast(const From * node) noexcept
{
  return isa<T>(node) ? static_cast<const T *>(node) : nullptr;
}

}  // namespace scssls

// scssls/cst/cst_context.hpp - Arena that owns syntax tree nodes
//
// Uses std::pmr::monotonic_buffer_resource: nodes are never freed
// individually, the whole tree goes away with the context.
//
#pragma once

#include <cstddef>
#include <memory_resource>
#include <type_traits>
#include <utility>

#include "scssls/cst/node.hpp"

namespace scssls::cst
{

/**
 * Owns every node and issue created while parsing one or more files.
 *
 * Nodes are valid as long as the context is alive.
 *
 * @code
 *   CstContext ctx;
 *   auto * rule = ctx.create<Ruleset>(range);
 *   auto * group = ctx.create<Node>(NodeKind::Generic, range);
 * @endcode
 */
class CstContext
{
public:
  /// Default initial buffer size (64KB)
  static constexpr size_t k_default_buffer_size = size_t{64} * size_t{1024};

  explicit CstContext(size_t initial_buffer_size = k_default_buffer_size)
  : arena_(initial_buffer_size)
  {
  }

  ~CstContext() = default;

  // Non-copyable and non-movable (PMR resources are not movable)
  CstContext(const CstContext &) = delete;
  CstContext & operator=(const CstContext &) = delete;
  CstContext(CstContext &&) = delete;
  CstContext & operator=(CstContext &&) = delete;

  /**
   * Create a node of type T in the arena.
   *
   * @return Non-owning pointer valid for the lifetime of the context
   */
  template <typename T, typename... Args>
  T * create(Args &&... args)
  {
    static_assert(std::is_base_of_v<Node, T>, "T must derive from cst::Node");
    static_assert(
      std::is_trivially_destructible_v<T>,
      "Syntax tree nodes must be trivially destructible to be managed by the arena");

    void * const mem = arena_.allocate(sizeof(T), alignof(T));
    T * const node = new (mem) T(std::forward<Args>(args)...);
    ++node_count_;
    return node;
  }

  /// Allocate a syntax issue record in the arena.
  ParseIssue * create_issue(ParseError error, SourceRange range, SourceRange skipped = {})
  {
    static_assert(std::is_trivially_destructible_v<ParseIssue>);
    void * const mem = arena_.allocate(sizeof(ParseIssue), alignof(ParseIssue));
    return new (mem) ParseIssue{error, range, skipped, nullptr};
  }

  /// Number of nodes created so far (abandoned speculative nodes included).
  [[nodiscard]] size_t node_count() const noexcept { return node_count_; }

private:
  std::pmr::monotonic_buffer_resource arena_;
  size_t node_count_ = 0;
};

}  // namespace scssls::cst

// scssls/cst/node_kind.hpp - Node kind enumeration
#pragma once

#include <cstdint>
#include <string_view>

namespace scssls::cst
{

enum class NodeKind : uint8_t {
#define SCSSLS_NODE_KIND(Kind, Name) Kind,
#include "scssls/cst/node_kinds.def"
};

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

/// Kinds that own a brace-delimited declaration body.
[[nodiscard]] bool is_body_kind(NodeKind kind) noexcept;

/**
 * What an identifier refers to, for editor features such as
 * go-to-definition.
 */
enum class ReferenceKind : uint8_t {
  Unknown,
  Selector,
  Property,
  Variable,
  Mixin,
  Function,
  Keyframe,
  Module,
  Forward,
  ForwardVisibility,
};

[[nodiscard]] std::string_view to_string(ReferenceKind kind) noexcept;

}  // namespace scssls::cst

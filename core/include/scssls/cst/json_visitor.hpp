// scssls/cst/json_visitor.hpp - JSON serialization for syntax trees
//
// Returns nlohmann::json objects for any node, used by `scssc dump --json`
// and by editor integrations that consume the tree out of process.
//
#pragma once

#include <nlohmann/json.hpp>
#include <string_view>

#include "scssls/cst/node.hpp"

namespace scssls::cst
{

/**
 * Serialize a node and its subtree to JSON.
 *
 * Every object carries `kind`, `range` (`{start, end}` byte offsets, null
 * when the node has no range) and `children`. Leaves add their source
 * `text`; nodes with named roles add a `roles` object mapping the role name
 * to the index of the child that fills it; erroneous nodes add `issues`.
 *
 * @param node    The node to serialize (null yields JSON null)
 * @param source  Text of the file the tree was parsed from
 */
[[nodiscard]] nlohmann::json to_json(const Node * node, std::string_view source);

}  // namespace scssls::cst

// scssls/cst/json_visitor.cpp - JSON serialization implementation
//
#include "scssls/cst/json_visitor.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <string_view>

#include "scssls/basic/casting.hpp"
#include "scssls/basic/source_manager.hpp"

namespace scssls::cst
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.begin()}, {"end", r.end()}};
}

/// Index of `slot` among the direct children of `node`, or -1.
int64_t child_index(const Node * node, const Node * slot)
{
  if (slot == nullptr) {
    return -1;
  }
  int64_t i = 0;
  for (const Node * child : node->children()) {
    if (child == slot) {
      return i;
    }
    ++i;
  }
  return -1;
}

void add_role(json & roles, const Node * node, const char * name, const Node * slot)
{
  const int64_t index = child_index(node, slot);
  if (index >= 0) {
    roles[name] = index;
  }
}

// ============================================================================
// Role slots and flags
// ============================================================================

void add_roles(json & j, const Node * node)
{
  json roles = json::object();

  if (const auto * body = dyn_cast<BodyDeclaration>(node)) {
    add_role(roles, node, "declarations", body->declarations);
  }

  switch (node->get_kind()) {
    case NodeKind::Identifier: {
      const auto * n = cast<Identifier>(node);
      j["reference"] = std::string(to_string(n->reference));
      if (n->is_custom_property) j["custom_property"] = true;
      break;
    }
    case NodeKind::BinaryExpression: {
      const auto * n = cast<BinaryExpression>(node);
      add_role(roles, node, "left", n->left);
      add_role(roles, node, "operator", n->op);
      add_role(roles, node, "right", n->right);
      break;
    }
    case NodeKind::Term: {
      const auto * n = cast<Term>(node);
      add_role(roles, node, "operator", n->op);
      add_role(roles, node, "expression", n->expression);
      break;
    }
    case NodeKind::Function: {
      const auto * n = cast<Function>(node);
      add_role(roles, node, "identifier", n->identifier);
      add_role(roles, node, "arguments", n->arguments);
      break;
    }
    case NodeKind::FunctionArgument: {
      const auto * n = cast<FunctionArgument>(node);
      add_role(roles, node, "identifier", n->identifier);
      add_role(roles, node, "value", n->value);
      break;
    }
    case NodeKind::FunctionParameter: {
      const auto * n = cast<FunctionParameter>(node);
      add_role(roles, node, "identifier", n->identifier);
      add_role(roles, node, "default_value", n->default_value);
      if (n->is_variadic) j["variadic"] = true;
      break;
    }
    case NodeKind::ListEntry: {
      const auto * n = cast<ListEntry>(node);
      add_role(roles, node, "key", n->key);
      add_role(roles, node, "value", n->value);
      break;
    }
    case NodeKind::ModuleMember:
      add_role(roles, node, "identifier", cast<ModuleMember>(node)->identifier);
      break;
    case NodeKind::Declaration: {
      const auto * n = cast<Declaration>(node);
      add_role(roles, node, "property", n->property);
      add_role(roles, node, "value", n->value);
      add_role(roles, node, "nested_properties", n->nested_properties);
      if (n->colon_position != Declaration::k_no_position) j["colon"] = n->colon_position;
      if (n->semicolon_position != Declaration::k_no_position) {
        j["semicolon"] = n->semicolon_position;
      }
      break;
    }
    case NodeKind::Property:
      add_role(roles, node, "identifier", cast<Property>(node)->identifier);
      break;
    case NodeKind::VariableDeclaration: {
      const auto * n = cast<VariableDeclaration>(node);
      add_role(roles, node, "variable", n->variable);
      add_role(roles, node, "value", n->value);
      if (n->colon_position != VariableDeclaration::k_no_position) j["colon"] = n->colon_position;
      if (n->semicolon_position != VariableDeclaration::k_no_position) {
        j["semicolon"] = n->semicolon_position;
      }
      if (n->is_default) j["default"] = true;
      if (n->is_global) j["global"] = true;
      break;
    }
    case NodeKind::Ruleset:
      add_role(roles, node, "selectors", cast<Ruleset>(node)->selectors);
      break;
    case NodeKind::MixinDeclaration: {
      const auto * n = cast<MixinDeclaration>(node);
      add_role(roles, node, "identifier", n->identifier);
      add_role(roles, node, "parameters", n->parameters);
      break;
    }
    case NodeKind::FunctionDeclaration: {
      const auto * n = cast<FunctionDeclaration>(node);
      add_role(roles, node, "identifier", n->identifier);
      add_role(roles, node, "parameters", n->parameters);
      break;
    }
    case NodeKind::MixinContentDeclaration:
      add_role(roles, node, "parameters", cast<MixinContentDeclaration>(node)->parameters);
      break;
    case NodeKind::IfStatement: {
      const auto * n = cast<IfStatement>(node);
      add_role(roles, node, "condition", n->condition);
      add_role(roles, node, "else", n->else_clause);
      break;
    }
    case NodeKind::ForStatement: {
      const auto * n = cast<ForStatement>(node);
      add_role(roles, node, "variable", n->variable);
      add_role(roles, node, "from", n->from);
      add_role(roles, node, "to", n->to);
      if (n->is_inclusive) j["inclusive"] = true;
      break;
    }
    case NodeKind::EachStatement: {
      const auto * n = cast<EachStatement>(node);
      add_role(roles, node, "variables", n->variables);
      add_role(roles, node, "expression", n->expression);
      break;
    }
    case NodeKind::WhileStatement:
      add_role(roles, node, "condition", cast<WhileStatement>(node)->condition);
      break;
    case NodeKind::Keyframe: {
      const auto * n = cast<Keyframe>(node);
      add_role(roles, node, "keyword", n->keyword);
      add_role(roles, node, "identifier", n->identifier);
      break;
    }
    case NodeKind::Layer:
      add_role(roles, node, "names", cast<Layer>(node)->names);
      break;
    case NodeKind::PropertyAtRule:
      add_role(roles, node, "name", cast<PropertyAtRule>(node)->name);
      break;
    case NodeKind::MixinReference: {
      const auto * n = cast<MixinReference>(node);
      add_role(roles, node, "identifier", n->identifier);
      add_role(roles, node, "arguments", n->arguments);
      add_role(roles, node, "content", n->content);
      break;
    }
    case NodeKind::MixinContentReference:
      add_role(roles, node, "arguments", cast<MixinContentReference>(node)->arguments);
      break;
    case NodeKind::ExtendsReference: {
      const auto * n = cast<ExtendsReference>(node);
      add_role(roles, node, "selectors", n->selectors);
      if (n->is_optional) j["optional"] = true;
      break;
    }
    case NodeKind::Use: {
      const auto * n = cast<Use>(node);
      add_role(roles, node, "path", n->path);
      add_role(roles, node, "identifier", n->identifier);
      add_role(roles, node, "parameters", n->parameters);
      if (n->is_wildcard) j["wildcard"] = true;
      break;
    }
    case NodeKind::Forward: {
      const auto * n = cast<Forward>(node);
      add_role(roles, node, "path", n->path);
      add_role(roles, node, "identifier", n->identifier);
      add_role(roles, node, "parameters", n->parameters);
      add_role(roles, node, "visibility", n->visibility);
      break;
    }
    case NodeKind::ModuleConfiguration: {
      const auto * n = cast<ModuleConfiguration>(node);
      add_role(roles, node, "identifier", n->identifier);
      add_role(roles, node, "value", n->value);
      if (n->is_default) j["default"] = true;
      break;
    }
    case NodeKind::ForwardVisibility:
      add_role(roles, node, "identifier", cast<ForwardVisibility>(node)->identifier);
      break;
    default:
      break;
  }

  if (!roles.empty()) {
    j["roles"] = std::move(roles);
  }
}

json j_issues(const Node * node)
{
  json issues = json::array();
  for (const ParseIssue * issue = node->issues(); issue != nullptr; issue = issue->next) {
    json ji{
      {"code", std::string(code(issue->error))},
      {"message", std::string(message(issue->error))},
      {"range", j_range(issue->range)}};
    if (issue->skipped.is_valid()) {
      ji["skipped"] = j_range(issue->skipped);
    }
    issues.push_back(std::move(ji));
  }
  return issues;
}

}  // namespace

json to_json(const Node * node, std::string_view source)
{
  if (node == nullptr) {
    return nullptr;
  }

  json j{{"kind", std::string(to_string(node->get_kind()))}, {"range", j_range(node->get_range())}};

  const SourceRange r = node->get_range();
  if (!node->has_children() && r.is_valid() && r.end() <= source.size()) {
    j["text"] = std::string(source.substr(r.begin(), r.size()));
  }

  add_roles(j, node);

  if (node->has_issues()) {
    j["issues"] = j_issues(node);
  }

  json children = json::array();
  for (const Node * child : node->children()) {
    children.push_back(to_json(child, source));
  }
  j["children"] = std::move(children);
  return j;
}

}  // namespace scssls::cst

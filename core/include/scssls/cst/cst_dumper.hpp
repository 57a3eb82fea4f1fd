// scssls/cst/cst_dumper.hpp - Debug syntax tree output
//
// Dumps a syntax tree in a human-readable indented format, used by
// `scssc dump` and by tests.
//
#pragma once

#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

#include "scssls/cst/node.hpp"

namespace scssls::cst
{

// ============================================================================
// CstDumper - Debug tree output
// ============================================================================

/**
 * Dumps syntax tree nodes in a human-readable tree format.
 *
 * @code
 *   Stylesheet [0, 9)
 *   `-VariableDeclaration [0, 8)
 *     |-Variable [0, 2) '$x'
 *     `-Expression [4, 7)
 *       `-BinaryExpression [4, 7)
 *         `-Term [4, 7)
 *           `-NumericValue [4, 7) '1px'
 * @endcode
 *
 * Leaves print their source text; issues print as `error E005: colon expected`
 * lines below the node that owns them. Lists and grouping nodes print with
 * their kind name like any other node.
 */
class CstDumper
{
public:
  /// @param source  text of the file the tree was parsed from (used for leaf text)
  CstDumper(std::ostream & os, std::string_view source) : os_(os), source_(source) {}

  /// Dump a node and its subtree
  void dump(const Node * node)
  {
    if (node == nullptr) {
      os_ << "<null>\n";
      return;
    }
    print_node(node);
    print_children(node);
  }

private:
  void print_node(const Node * node)
  {
    os_ << to_string(node->get_kind());
    const SourceRange r = node->get_range();
    if (r.is_valid()) {
      os_ << " [" << r.begin() << ", " << r.end() << ")";
    }
    if (!node->has_children() && r.is_valid() && r.end() <= source_.size()) {
      os_ << " '" << source_.substr(r.begin(), r.size()) << "'";
    }
    print_flags(node);
    os_ << "\n";

    for (const ParseIssue * issue = node->issues(); issue != nullptr; issue = issue->next) {
      os_ << prefix_ << (node->has_children() ? "| " : "  ") << "!! error " << code(issue->error)
          << ": " << message(issue->error) << " at " << issue->range.begin() << "\n";
    }
  }

  void print_flags(const Node * node)
  {
    switch (node->get_kind()) {
      case NodeKind::VariableDeclaration: {
        const auto * decl = static_cast<const VariableDeclaration *>(node);
        if (decl->is_default) os_ << " !default";
        if (decl->is_global) os_ << " !global";
        break;
      }
      case NodeKind::ForStatement:
        if (static_cast<const ForStatement *>(node)->is_inclusive) os_ << " through";
        break;
      case NodeKind::FunctionParameter:
        if (static_cast<const FunctionParameter *>(node)->is_variadic) os_ << " ...";
        break;
      case NodeKind::ExtendsReference:
        if (static_cast<const ExtendsReference *>(node)->is_optional) os_ << " !optional";
        break;
      case NodeKind::Use:
        if (static_cast<const Use *>(node)->is_wildcard) os_ << " as *";
        break;
      case NodeKind::ModuleConfiguration:
        if (static_cast<const ModuleConfiguration *>(node)->is_default) os_ << " !default";
        break;
      case NodeKind::Identifier: {
        const auto * ident = static_cast<const Identifier *>(node);
        if (ident->reference != ReferenceKind::Unknown) {
          os_ << " <" << to_string(ident->reference) << ">";
        }
        break;
      }
      default:
        break;
    }
  }

  void print_children(const Node * node)
  {
    for (const Node * child : node->children()) {
      const bool is_last = child->next_sibling() == nullptr;
      os_ << prefix_ << (is_last ? "`-" : "|-");

      const std::string saved = prefix_;
      prefix_ += is_last ? "  " : "| ";
      print_node(child);
      print_children(child);
      prefix_ = saved;
    }
  }

  std::ostream & os_;
  std::string_view source_;
  std::string prefix_;
};

// ============================================================================
// Convenience Functions
// ============================================================================

/// Dump a syntax tree to the given output stream.
inline void dump(const Node * node, std::string_view source, std::ostream & os)
{
  CstDumper dumper(os, source);
  dumper.dump(node);
}

/// Dump a syntax tree to a string.
[[nodiscard]] inline std::string dump_to_string(const Node * node, std::string_view source)
{
  std::ostringstream ss;
  dump(node, source, ss);
  return ss.str();
}

}  // namespace scssls::cst

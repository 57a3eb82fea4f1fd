// scssls/cst/node.hpp - Concrete syntax tree node classes
//
// Every node covers a contiguous source range, knows its parent and keeps
// its children in source order. Typed classes add named slots on top of
// the generic child list; a slot child is always also a descendant.
//
// Nodes live in a CstContext arena and must stay trivially destructible.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <iterator>

#include "scssls/basic/casting.hpp"
#include "scssls/basic/source_manager.hpp"
#include "scssls/cst/node_kind.hpp"
#include "scssls/cst/parse_error.hpp"

namespace scssls::cst
{

/// Syntax error attached to the node being built when it was detected.
struct ParseIssue
{
  ParseError error;
  SourceRange range;    ///< offending token
  SourceRange skipped;  ///< tokens discarded while resynchronizing (invalid if none)
  const ParseIssue * next;
};

// ============================================================================
// Node
// ============================================================================

/**
 * Base class for all syntax tree nodes.
 *
 * Nodes are non-copyable and managed by CstContext.
 */
class Node
{
public:
  const NodeKind kind;
  SourceRange range_;

  Node(NodeKind k, SourceRange r) noexcept : kind(k), range_(r) {}
  ~Node() = default;

  // Non-copyable, non-movable (managed by CstContext)
  Node(const Node &) = delete;
  Node & operator=(const Node &) = delete;
  Node(Node &&) = delete;
  Node & operator=(Node &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }
  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }
  [[nodiscard]] uint32_t offset() const noexcept { return range_.begin(); }
  [[nodiscard]] uint32_t end() const noexcept { return range_.end(); }
  [[nodiscard]] uint32_t length() const noexcept { return range_.size(); }

  // ===========================================================================
  // Tree structure
  // ===========================================================================

  [[nodiscard]] Node * parent() const noexcept { return parent_; }
  [[nodiscard]] Node * first_child() const noexcept { return first_child_; }
  [[nodiscard]] Node * last_child() const noexcept { return last_child_; }
  [[nodiscard]] Node * next_sibling() const noexcept { return next_sibling_; }
  [[nodiscard]] Node * prev_sibling() const noexcept { return prev_sibling_; }
  [[nodiscard]] size_t child_count() const noexcept { return child_count_; }
  [[nodiscard]] bool has_children() const noexcept { return first_child_ != nullptr; }

  /// Child at `index` in source order, nullptr when out of range.
  [[nodiscard]] Node * child_at(size_t index) const noexcept;

  /// First direct child of the given kind.
  [[nodiscard]] Node * find_child(NodeKind k) const noexcept;

  /// True when `this` is `ancestor` or lies below it.
  [[nodiscard]] bool is_descendant_of(const Node * ancestor) const noexcept;

  /**
   * Append a child, detaching it from any previous parent first.
   *
   * The node's range grows to cover the child's range.
   *
   * @return false if `child` is null
   */
  bool add_child(Node * child) noexcept;

  /// Detach from the current parent (no-op for roots).
  void detach() noexcept;

  class ChildIterator
  {
  public:
    using iterator_category = std::forward_iterator_tag;
    using value_type = Node *;
    using difference_type = std::ptrdiff_t;
    using pointer = Node * const *;
    using reference = Node *;

    explicit ChildIterator(Node * node = nullptr) noexcept : node_(node) {}

    Node * operator*() const noexcept { return node_; }
    ChildIterator & operator++() noexcept
    {
      node_ = node_->next_sibling();
      return *this;
    }
    ChildIterator operator++(int) noexcept
    {
      ChildIterator tmp = *this;
      ++*this;
      return tmp;
    }
    bool operator==(const ChildIterator & other) const noexcept { return node_ == other.node_; }
    bool operator!=(const ChildIterator & other) const noexcept { return node_ != other.node_; }

  private:
    Node * node_;
  };

  struct ChildRange
  {
    Node * first;

    [[nodiscard]] ChildIterator begin() const noexcept { return ChildIterator(first); }
    [[nodiscard]] ChildIterator end() const noexcept { return ChildIterator(); }
  };

  [[nodiscard]] ChildRange children() const noexcept { return ChildRange{first_child_}; }

  /**
   * Pre-order traversal. `fn(node)` returns false to skip the node's
   * children.
   */
  template <typename Fn>
  void walk(Fn && fn) const
  {
    if (!fn(this)) {
      return;
    }
    for (const Node * child = first_child_; child != nullptr; child = child->next_sibling_) {
      child->walk(fn);
    }
  }

  // ===========================================================================
  // Issues
  // ===========================================================================

  void add_issue(ParseIssue * issue) noexcept;

  [[nodiscard]] const ParseIssue * issues() const noexcept { return first_issue_; }
  [[nodiscard]] bool has_issues() const noexcept { return first_issue_ != nullptr; }

  /// True when this node (or, with `recursive`, any descendant) carries an issue.
  [[nodiscard]] bool is_erroneous(bool recursive = false) const noexcept;

  static bool classof(const Node * /*node*/) { return true; }

protected:
  /// Fill a typed slot. The child joins the child list unless it already
  /// is a descendant.
  template <typename T>
  bool set_slot(T *& slot, T * child) noexcept
  {
    if (child == nullptr) {
      return false;
    }
    if (!child->is_descendant_of(this)) {
      add_child(child);
    }
    slot = child;
    return true;
  }

private:
  void extend_to(SourceRange r) noexcept;

  Node * parent_ = nullptr;
  Node * first_child_ = nullptr;
  Node * last_child_ = nullptr;
  Node * next_sibling_ = nullptr;
  Node * prev_sibling_ = nullptr;
  size_t child_count_ = 0;
  ParseIssue * first_issue_ = nullptr;
  ParseIssue * last_issue_ = nullptr;
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind node_kind = K;

  static bool classof(const Node * node) { return node->get_kind() == K; }

  explicit NodeBase(SourceRange r) noexcept : Base(K, r) {}
};

/**
 * Base class for constructs with a `{ ... }` declaration body.
 */
class BodyDeclaration : public Node
{
public:
  Node * declarations = nullptr;

  bool set_declarations(Node * node) noexcept { return set_slot(declarations, node); }

  static bool classof(const Node * node) { return is_body_kind(node->kind); }

protected:
  BodyDeclaration(NodeKind k, SourceRange r) noexcept : Node(k, r) {}
};

// ============================================================================
// Lexical units and expressions
// ============================================================================

class Stylesheet : public NodeBase<Stylesheet, Node, NodeKind::Stylesheet>
{
public:
  using NodeBase::NodeBase;
};

class Identifier : public NodeBase<Identifier, Node, NodeKind::Identifier>
{
public:
  ReferenceKind reference = ReferenceKind::Unknown;
  bool is_custom_property = false;

  using NodeBase::NodeBase;
};

class BinaryExpression : public NodeBase<BinaryExpression, Node, NodeKind::BinaryExpression>
{
public:
  Node * left = nullptr;
  Node * op = nullptr;
  Node * right = nullptr;

  using NodeBase::NodeBase;

  bool set_left(Node * node) noexcept { return set_slot(left, node); }
  bool set_operator(Node * node) noexcept { return set_slot(op, node); }
  bool set_right(Node * node) noexcept { return set_slot(right, node); }
};

/// Operand with an optional unary operator.
class Term : public NodeBase<Term, Node, NodeKind::Term>
{
public:
  Node * op = nullptr;
  Node * expression = nullptr;

  using NodeBase::NodeBase;

  bool set_operator(Node * node) noexcept { return set_slot(op, node); }
  bool set_expression(Node * node) noexcept { return set_slot(expression, node); }
};

class Function : public NodeBase<Function, Node, NodeKind::Function>
{
public:
  Node * identifier = nullptr;
  Node * arguments = nullptr;  ///< NodeList of FunctionArgument

  using NodeBase::NodeBase;

  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
};

/// Call argument: `$name: value`, `value` or `value...`.
class FunctionArgument : public NodeBase<FunctionArgument, Node, NodeKind::FunctionArgument>
{
public:
  Node * identifier = nullptr;
  Node * value = nullptr;

  using NodeBase::NodeBase;

  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
  bool set_value(Node * node) noexcept { return set_slot(value, node); }
};

/// Mixin or function parameter: `$name`, `$name: default` or `$name...`.
class FunctionParameter : public NodeBase<FunctionParameter, Node, NodeKind::FunctionParameter>
{
public:
  Node * identifier = nullptr;
  Node * default_value = nullptr;
  bool is_variadic = false;

  using NodeBase::NodeBase;

  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
  bool set_default_value(Node * node) noexcept { return set_slot(default_value, node); }
};

/// Entry of a parenthesized list or map: `key: value` or `value`.
class ListEntry : public NodeBase<ListEntry, Node, NodeKind::ListEntry>
{
public:
  Node * key = nullptr;
  Node * value = nullptr;

  using NodeBase::NodeBase;

  bool set_key(Node * node) noexcept { return set_slot(key, node); }
  bool set_value(Node * node) noexcept { return set_slot(value, node); }
};

/// `module.member` access.
class ModuleMember : public NodeBase<ModuleMember, Node, NodeKind::ModuleMember>
{
public:
  Node * identifier = nullptr;  ///< module name

  using NodeBase::NodeBase;

  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
};

// ============================================================================
// Declarations
// ============================================================================

/**
 * `property: value`, optionally followed by nested properties.
 *
 * Custom properties (`--name: ...`) keep their raw value as a
 * CustomPropertyValue node when it is not a well-formed expression.
 */
class Declaration : public NodeBase<Declaration, Node, NodeKind::Declaration>
{
public:
  static constexpr uint32_t k_no_position = UINT32_MAX;

  Node * property = nullptr;
  Node * value = nullptr;
  Node * nested_properties = nullptr;
  uint32_t colon_position = k_no_position;
  uint32_t semicolon_position = k_no_position;

  using NodeBase::NodeBase;

  bool set_property(Node * node) noexcept { return set_slot(property, node); }
  bool set_value(Node * node) noexcept { return set_slot(value, node); }
  bool set_nested_properties(Node * node) noexcept { return set_slot(nested_properties, node); }
};

class Property : public NodeBase<Property, Node, NodeKind::Property>
{
public:
  Node * identifier = nullptr;

  using NodeBase::NodeBase;

  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
};

class VariableDeclaration
: public NodeBase<VariableDeclaration, Node, NodeKind::VariableDeclaration>
{
public:
  static constexpr uint32_t k_no_position = UINT32_MAX;

  Node * variable = nullptr;
  Node * value = nullptr;
  uint32_t colon_position = k_no_position;
  uint32_t semicolon_position = k_no_position;
  bool is_default = false;
  bool is_global = false;

  using NodeBase::NodeBase;

  bool set_variable(Node * node) noexcept { return set_slot(variable, node); }
  bool set_value(Node * node) noexcept { return set_slot(value, node); }
};

// ============================================================================
// Body declarations
// ============================================================================

class Ruleset : public NodeBase<Ruleset, BodyDeclaration, NodeKind::Ruleset>
{
public:
  Node * selectors = nullptr;  ///< NodeList of Selector

  using NodeBase::NodeBase;
};

class NestedProperties
: public NodeBase<NestedProperties, BodyDeclaration, NodeKind::NestedProperties>
{
public:
  using NodeBase::NodeBase;
};

class MixinDeclaration
: public NodeBase<MixinDeclaration, BodyDeclaration, NodeKind::MixinDeclaration>
{
public:
  Node * identifier = nullptr;
  Node * parameters = nullptr;  ///< NodeList of FunctionParameter

  using NodeBase::NodeBase;

  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
};

class FunctionDeclaration
: public NodeBase<FunctionDeclaration, BodyDeclaration, NodeKind::FunctionDeclaration>
{
public:
  Node * identifier = nullptr;
  Node * parameters = nullptr;  ///< NodeList of FunctionParameter

  using NodeBase::NodeBase;

  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
};

/// Trailing block passed to `@include`, optionally `using ($params)`.
class MixinContentDeclaration
: public NodeBase<MixinContentDeclaration, BodyDeclaration, NodeKind::MixinContentDeclaration>
{
public:
  Node * parameters = nullptr;  ///< NodeList of FunctionParameter

  using NodeBase::NodeBase;
};

class IfStatement : public NodeBase<IfStatement, BodyDeclaration, NodeKind::IfStatement>
{
public:
  Node * condition = nullptr;
  Node * else_clause = nullptr;

  using NodeBase::NodeBase;

  bool set_condition(Node * node) noexcept { return set_slot(condition, node); }
  bool set_else_clause(Node * node) noexcept { return set_slot(else_clause, node); }
};

class ElseClause : public NodeBase<ElseClause, BodyDeclaration, NodeKind::ElseClause>
{
public:
  using NodeBase::NodeBase;
};

class ForStatement : public NodeBase<ForStatement, BodyDeclaration, NodeKind::ForStatement>
{
public:
  Node * variable = nullptr;
  Node * from = nullptr;
  Node * to = nullptr;
  bool is_inclusive = false;  ///< `through` rather than `to`

  using NodeBase::NodeBase;

  bool set_variable(Node * node) noexcept { return set_slot(variable, node); }
  bool set_from(Node * node) noexcept { return set_slot(from, node); }
  bool set_to(Node * node) noexcept { return set_slot(to, node); }
};

class EachStatement : public NodeBase<EachStatement, BodyDeclaration, NodeKind::EachStatement>
{
public:
  Node * variables = nullptr;  ///< NodeList of Variable
  Node * expression = nullptr;

  using NodeBase::NodeBase;

  bool set_expression(Node * node) noexcept { return set_slot(expression, node); }
};

class WhileStatement
: public NodeBase<WhileStatement, BodyDeclaration, NodeKind::WhileStatement>
{
public:
  Node * condition = nullptr;

  using NodeBase::NodeBase;

  bool set_condition(Node * node) noexcept { return set_slot(condition, node); }
};

class Media : public NodeBase<Media, BodyDeclaration, NodeKind::Media>
{
public:
  using NodeBase::NodeBase;
};

class Keyframe : public NodeBase<Keyframe, BodyDeclaration, NodeKind::Keyframe>
{
public:
  Node * keyword = nullptr;
  Node * identifier = nullptr;

  using NodeBase::NodeBase;

  bool set_keyword(Node * node) noexcept { return set_slot(keyword, node); }
  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
};

class KeyframeSelector
: public NodeBase<KeyframeSelector, BodyDeclaration, NodeKind::KeyframeSelector>
{
public:
  using NodeBase::NodeBase;
};

class FontFace : public NodeBase<FontFace, BodyDeclaration, NodeKind::FontFace>
{
public:
  using NodeBase::NodeBase;
};

class Supports : public NodeBase<Supports, BodyDeclaration, NodeKind::Supports>
{
public:
  using NodeBase::NodeBase;
};

class Layer : public NodeBase<Layer, BodyDeclaration, NodeKind::Layer>
{
public:
  Node * names = nullptr;

  using NodeBase::NodeBase;

  bool set_names(Node * node) noexcept { return set_slot(names, node); }
};

class PropertyAtRule : public NodeBase<PropertyAtRule, BodyDeclaration, NodeKind::PropertyAtRule>
{
public:
  Node * name = nullptr;

  using NodeBase::NodeBase;

  bool set_name(Node * node) noexcept { return set_slot(name, node); }
};

// ============================================================================
// Mixin references and other statements
// ============================================================================

class MixinReference : public NodeBase<MixinReference, Node, NodeKind::MixinReference>
{
public:
  Node * identifier = nullptr;
  Node * arguments = nullptr;  ///< NodeList of FunctionArgument
  Node * content = nullptr;    ///< MixinContentDeclaration

  using NodeBase::NodeBase;

  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
  bool set_content(Node * node) noexcept { return set_slot(content, node); }
};

/// `@content` or `@content(args)`.
class MixinContentReference
: public NodeBase<MixinContentReference, Node, NodeKind::MixinContentReference>
{
public:
  Node * arguments = nullptr;  ///< NodeList of FunctionArgument

  using NodeBase::NodeBase;
};

class ExtendsReference : public NodeBase<ExtendsReference, Node, NodeKind::ExtendsReference>
{
public:
  Node * selectors = nullptr;  ///< NodeList of Selector
  bool is_optional = false;

  using NodeBase::NodeBase;
};

class Use : public NodeBase<Use, Node, NodeKind::Use>
{
public:
  Node * path = nullptr;
  Node * identifier = nullptr;  ///< namespace after `as`
  Node * parameters = nullptr;  ///< NodeList of ModuleConfiguration
  bool is_wildcard = false;     ///< `as *`

  using NodeBase::NodeBase;

  bool set_path(Node * node) noexcept { return set_slot(path, node); }
  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
};

class Forward : public NodeBase<Forward, Node, NodeKind::Forward>
{
public:
  Node * path = nullptr;
  Node * identifier = nullptr;  ///< prefix after `as`, without the trailing `*`
  Node * parameters = nullptr;  ///< NodeList of ModuleConfiguration
  Node * visibility = nullptr;  ///< ForwardVisibility

  using NodeBase::NodeBase;

  bool set_path(Node * node) noexcept { return set_slot(path, node); }
  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
  bool set_visibility(Node * node) noexcept { return set_slot(visibility, node); }
};

/// `$name: value !default` inside `with (...)`.
class ModuleConfiguration
: public NodeBase<ModuleConfiguration, Node, NodeKind::ModuleConfiguration>
{
public:
  Node * identifier = nullptr;
  Node * value = nullptr;
  bool is_default = false;

  using NodeBase::NodeBase;

  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
  bool set_value(Node * node) noexcept { return set_slot(value, node); }
};

/// `hide a, $b` or `show a, $b` on a forward rule.
class ForwardVisibility
: public NodeBase<ForwardVisibility, Node, NodeKind::ForwardVisibility>
{
public:
  Node * identifier = nullptr;  ///< the `hide`/`show` keyword

  using NodeBase::NodeBase;

  bool set_identifier(Node * node) noexcept { return set_slot(identifier, node); }
};

}  // namespace scssls::cst

// scssls/cst/node.cpp - Syntax tree node implementation
#include "scssls/cst/node.hpp"

#include <algorithm>

namespace scssls::cst
{

// ============================================================================
// Kind tables
// ============================================================================

std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
#define SCSSLS_NODE_KIND(Kind, Name) \
  case NodeKind::Kind:               \
    return Name;
#include "scssls/cst/node_kinds.def"
  }
  return "Unknown";
}

bool is_body_kind(NodeKind kind) noexcept
{
  switch (kind) {
#define SCSSLS_BODY_NODE_KIND(Kind, Name) \
  case NodeKind::Kind:                    \
    return true;
#include "scssls/cst/node_kinds.def"
    default:
      return false;
  }
}

std::string_view to_string(ReferenceKind kind) noexcept
{
  switch (kind) {
    case ReferenceKind::Unknown:
      return "unknown";
    case ReferenceKind::Selector:
      return "selector";
    case ReferenceKind::Property:
      return "property";
    case ReferenceKind::Variable:
      return "variable";
    case ReferenceKind::Mixin:
      return "mixin";
    case ReferenceKind::Function:
      return "function";
    case ReferenceKind::Keyframe:
      return "keyframe";
    case ReferenceKind::Module:
      return "module";
    case ReferenceKind::Forward:
      return "forward";
    case ReferenceKind::ForwardVisibility:
      return "forward-visibility";
  }
  return "unknown";
}

std::string_view message(ParseError error) noexcept
{
  switch (error) {
#define SCSSLS_PARSE_ERROR(Kind, Code, Message) \
  case ParseError::Kind:                        \
    return Message;
#include "scssls/cst/parse_errors.def"
  }
  return "syntax error";
}

std::string_view code(ParseError error) noexcept
{
  switch (error) {
#define SCSSLS_PARSE_ERROR(Kind, Code, Message) \
  case ParseError::Kind:                        \
    return Code;
#include "scssls/cst/parse_errors.def"
  }
  return "E000";
}

// ============================================================================
// Node
// ============================================================================

Node * Node::child_at(size_t index) const noexcept
{
  Node * child = first_child_;
  for (size_t i = 0; child != nullptr && i < index; ++i) {
    child = child->next_sibling_;
  }
  return child;
}

Node * Node::find_child(NodeKind k) const noexcept
{
  for (Node * child = first_child_; child != nullptr; child = child->next_sibling_) {
    if (child->kind == k) {
      return child;
    }
  }
  return nullptr;
}

bool Node::is_descendant_of(const Node * ancestor) const noexcept
{
  for (const Node * n = this; n != nullptr; n = n->parent_) {
    if (n == ancestor) {
      return true;
    }
  }
  return false;
}

bool Node::add_child(Node * child) noexcept
{
  if (child == nullptr) {
    return false;
  }
  if (child->parent_ == this) {
    return true;
  }
  child->detach();

  child->parent_ = this;
  child->prev_sibling_ = last_child_;
  if (last_child_ != nullptr) {
    last_child_->next_sibling_ = child;
  } else {
    first_child_ = child;
  }
  last_child_ = child;
  ++child_count_;

  extend_to(child->range_);
  return true;
}

void Node::detach() noexcept
{
  if (parent_ == nullptr) {
    return;
  }
  if (prev_sibling_ != nullptr) {
    prev_sibling_->next_sibling_ = next_sibling_;
  } else {
    parent_->first_child_ = next_sibling_;
  }
  if (next_sibling_ != nullptr) {
    next_sibling_->prev_sibling_ = prev_sibling_;
  } else {
    parent_->last_child_ = prev_sibling_;
  }
  --parent_->child_count_;
  parent_ = nullptr;
  prev_sibling_ = nullptr;
  next_sibling_ = nullptr;
}

void Node::extend_to(SourceRange r) noexcept
{
  if (!r.is_valid()) {
    return;
  }
  if (!range_.is_valid()) {
    range_ = r;
    return;
  }
  range_ = SourceRange(
    range_.file_id(), std::min(range_.begin(), r.begin()), std::max(range_.end(), r.end()));
}

void Node::add_issue(ParseIssue * issue) noexcept
{
  if (issue == nullptr) {
    return;
  }
  if (last_issue_ != nullptr) {
    last_issue_->next = issue;
  } else {
    first_issue_ = issue;
  }
  last_issue_ = issue;
}

bool Node::is_erroneous(bool recursive) const noexcept
{
  if (first_issue_ != nullptr) {
    return true;
  }
  if (!recursive) {
    return false;
  }
  for (const Node * child = first_child_; child != nullptr; child = child->next_sibling_) {
    if (child->is_erroneous(true)) {
      return true;
    }
  }
  return false;
}

}  // namespace scssls::cst

// scssls/test_support/parse_helpers.hpp - helpers for unit tests
//
// `parse()` runs the full single-file pipeline. `prepare()` lexes a snippet
// and hands out a dialect parser positioned at its first token, so single
// productions can be driven and the cursor inspected afterwards.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "scssls/basic/diagnostic.hpp"
#include "scssls/basic/source_manager.hpp"
#include "scssls/cst/cst_context.hpp"
#include "scssls/cst/node.hpp"
#include "scssls/syntax/frontend.hpp"
#include "scssls/syntax/lexer.hpp"
#include "scssls/syntax/scss_parser.hpp"

namespace scssls::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<cst::CstContext> ctx;
  DiagnosticBag diags;
  cst::Stylesheet * stylesheet = nullptr;

  [[nodiscard]] const SourceFile * source_file() const noexcept
  {
    return sources.get_file(file_id);
  }

  [[nodiscard]] std::string_view source() const noexcept { return source_file()->content(); }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }

  [[nodiscard]] std::string_view slice(const cst::Node * node) const noexcept
  {
    return sources.get_slice(node->get_range());
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources.get_full_range(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.scss")
{
  TestParseUnit out;
  out.ctx = std::make_unique<cst::CstContext>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ctx, out.diags);
  out.file_id = parsed.file_id;
  out.stylesheet = parsed.stylesheet;
  return out;
}

/// Token stream plus a parser over it. Not movable: the parser views `tokens`.
struct TestProductionUnit
{
  std::string text;
  std::vector<syntax::Token> tokens;
  cst::CstContext ctx;
  std::unique_ptr<syntax::ScssParser> parser;

  [[nodiscard]] size_t index() const noexcept { return parser->cursor().index(); }
  [[nodiscard]] const syntax::Token & token() const noexcept { return parser->cursor().token(); }

  [[nodiscard]] std::string_view slice(const cst::Node * node) const noexcept
  {
    return std::string_view(text).substr(node->offset(), node->length());
  }
};

[[nodiscard]] inline std::unique_ptr<TestProductionUnit> prepare(std::string src)
{
  auto out = std::make_unique<TestProductionUnit>();
  out->text = std::move(src);
  syntax::Lexer lexer(FileId{0}, out->text);
  out->tokens = lexer.lex_all();
  out->parser = std::make_unique<syntax::ScssParser>(out->ctx, out->tokens);
  return out;
}

/// First node of `kind` below `root` (pre-order), nullptr if none.
[[nodiscard]] inline const cst::Node * find_first(const cst::Node * root, cst::NodeKind kind)
{
  const cst::Node * found = nullptr;
  root->walk([&](const cst::Node * n) {
    if (found == nullptr && n->get_kind() == kind) {
      found = n;
    }
    return found == nullptr;
  });
  return found;
}

/// Every node of `kind` below `root`, in pre-order.
[[nodiscard]] inline std::vector<const cst::Node *> find_all(
  const cst::Node * root, cst::NodeKind kind)
{
  std::vector<const cst::Node *> out;
  root->walk([&](const cst::Node * n) {
    if (n->get_kind() == kind) {
      out.push_back(n);
    }
    return true;
  });
  return out;
}

/// Error codes of every diagnostic, in report order.
[[nodiscard]] inline std::vector<std::string> diagnostic_codes(const DiagnosticBag & diags)
{
  std::vector<std::string> out;
  for (const auto & d : diags) {
    out.push_back(d.code);
  }
  return out;
}

/// True if some diagnostic in `diags` carries `code`.
[[nodiscard]] inline bool has_diagnostic(const DiagnosticBag & diags, std::string_view code)
{
  for (const auto & d : diags) {
    if (d.code == code) {
      return true;
    }
  }
  return false;
}

}  // namespace scssls::test_support

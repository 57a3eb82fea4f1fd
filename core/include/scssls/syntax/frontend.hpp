// scssls/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <cstddef>
#include <filesystem>
#include <string>

#include "scssls/basic/diagnostic.hpp"
#include "scssls/basic/source_manager.hpp"
#include "scssls/cst/cst_context.hpp"
#include "scssls/cst/node.hpp"

namespace scssls
{

struct ParseOptions
{
  /// Syntax diagnostics reported per file; further issues stay on the tree only.
  size_t max_diagnostics = 64;
};

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  cst::Stylesheet * stylesheet = nullptr;  ///< never null after parse_source()
};

// Parse pipeline:
// source -> lexer (token stream) -> dialect parser (syntax tree) -> diagnostics
//
// Re-parsing a path that is already registered replaces its content.
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  cst::CstContext & ctx, DiagnosticBag & diags, const ParseOptions & options = {});

/**
 * Report the issues attached to the tree below `root`, ordered by offset.
 *
 * Only the first `max_diagnostics` issues are reported.
 *
 * @return number of diagnostics added to `diags`
 */
size_t collect_parse_diagnostics(
  const cst::Node * root, DiagnosticBag & diags, size_t max_diagnostics);

}  // namespace scssls

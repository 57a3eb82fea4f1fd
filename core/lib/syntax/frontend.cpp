// scssls/syntax/frontend.cpp - High-level parse pipeline
#include "scssls/syntax/frontend.hpp"

#include <algorithm>
#include <string>
#include <utility>
#include <vector>

#include "scssls/syntax/lexer.hpp"
#include "scssls/syntax/scss_parser.hpp"

namespace scssls
{

size_t collect_parse_diagnostics(
  const cst::Node * root, DiagnosticBag & diags, size_t max_diagnostics)
{
  std::vector<const cst::ParseIssue *> issues;
  root->walk([&](const cst::Node * n) {
    for (const cst::ParseIssue * issue = n->issues(); issue != nullptr; issue = issue->next) {
      issues.push_back(issue);
    }
    return true;
  });

  // Parents attach some issues after their children; report in source order.
  std::stable_sort(
    issues.begin(), issues.end(), [](const cst::ParseIssue * a, const cst::ParseIssue * b) {
      return a->range.begin() < b->range.begin();
    });

  const size_t count = std::min(issues.size(), max_diagnostics);
  for (size_t i = 0; i < count; ++i) {
    const cst::ParseIssue * issue = issues[i];
    auto builder = diags.report_error(issue->range, std::string(cst::message(issue->error)));
    builder.with_code(std::string(cst::code(issue->error)));
    if (issue->skipped.is_valid()) {
      builder.with_secondary_label(issue->skipped, "skipped while recovering");
    }
  }
  return count;
}

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  cst::CstContext & ctx, DiagnosticBag & diags, const ParseOptions & options)
{
  ParseOutput out;
  if (auto existing = sources.find_by_path(path)) {
    out.file_id = *existing;
    sources.update_content(out.file_id, std::move(source_text));
  } else {
    out.file_id = sources.register_file(path, std::move(source_text));
  }

  const SourceFile * file = sources.get_file(out.file_id);
  syntax::Lexer lexer(out.file_id, file->content());
  const std::vector<syntax::Token> tokens = lexer.lex_all();

  syntax::ScssParser parser(ctx, tokens);
  out.stylesheet = parser.parse_stylesheet();

  collect_parse_diagnostics(out.stylesheet, diags, options.max_diagnostics);
  return out;
}

}  // namespace scssls

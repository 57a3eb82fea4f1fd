// scssls/basic/diagnostic_printer.cpp - Diagnostic rendering
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "scssls/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>
#include <vector>

namespace scssls
{
namespace
{

constexpr std::string_view k_gutter = "      |";

std::string expand_tabs(std::string_view line)
{
  std::string out;
  out.reserve(line.size());
  for (const char c : line) {
    if (c == '\t') {
      out += "    ";
    } else if (c != '\r' && c != '\n') {
      out += c;
    }
  }
  return out;
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  print_header(diag);
  print_location(diag, sources);
  fmt::print(os_, "{}\n", k_gutter);

  for (const auto & label : diag.labels) {
    print_label(label, sources);
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<const Diagnostic *> ordered;
  ordered.reserve(diags.size());
  for (const auto & d : diags) {
    ordered.push_back(&d);
  }
  std::stable_sort(ordered.begin(), ordered.end(), [](const Diagnostic * a, const Diagnostic * b) {
    const SourceRange ra = a->primary_range();
    const SourceRange rb = b->primary_range();
    if (ra.file_id() != rb.file_id()) {
      return ra.file_id().value < rb.file_id().value;
    }
    return ra.begin() < rb.begin();
  });

  for (const Diagnostic * d : ordered) {
    print(*d, sources);
  }
}

void DiagnosticPrinter::print_summary(const DiagnosticBag & diags)
{
  const size_t errors = diags.size();
  fmt::print(os_, "{} error{}\n", errors, errors == 1 ? "" : "s");
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_header(const Diagnostic & diag)
{
  const std::string head =
    diag.code.empty() ? std::string("error") : fmt::format("error[{}]", diag.code);
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::red << head << rang::fg::reset << ": "
        << diag.message << rang::style::reset << "\n";
  } else {
    fmt::print(os_, "{}: {}\n", head, diag.message);
  }
}

void DiagnosticPrinter::print_location(const Diagnostic & diag, const SourceRegistry & sources)
{
  const SourceRange range = diag.primary_range();
  const std::string path = display_path(sources, range.file_id());
  const FullSourceRange fr = sources.get_full_range(range);

  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "  -->" << rang::style::reset
        << rang::fg::reset;
  } else {
    os_ << "  -->";
  }
  if (fr.is_valid()) {
    fmt::print(os_, " {}:{}:{}\n", path, fr.start_line, fr.start_column);
  } else {
    fmt::print(os_, " {}\n", path);
  }
}

void DiagnosticPrinter::print_label(const Label & label, const SourceRegistry & sources)
{
  const SourceFile * file = sources.get_file(label.range.file_id());
  const FullSourceRange fr = sources.get_full_range(label.range);
  if (file == nullptr || !fr.is_valid()) {
    if (!label.message.empty()) {
      print_note(label.message);
    }
    return;
  }

  const std::string_view line = file->get_line(fr.start_line - 1);

  if (use_color_) {
    os_ << rang::fg::cyan;
    fmt::print(os_, " {:>4} ", fr.start_line);
    os_ << rang::fg::reset << rang::style::bold << "| " << rang::style::reset;
  } else {
    fmt::print(os_, " {:>4} | ", fr.start_line);
  }
  fmt::print(os_, "{}\n", expand_tabs(line));

  // Multi-line ranges are marked up to the end of their first line.
  const auto line_end_col = static_cast<uint32_t>(line.size()) + 1;
  const uint32_t end_col = fr.end_line == fr.start_line ? fr.end_column : line_end_col;
  print_marker_line(line, fr.start_column, end_col, label);
}

void DiagnosticPrinter::print_marker_line(
  std::string_view line, uint32_t start_col, uint32_t end_col, const Label & label)
{
  std::string prefix;
  for (uint32_t col = 1; col < start_col && col - 1 < line.size(); ++col) {
    prefix += (line[col - 1] == '\t') ? "    " : " ";
  }

  const size_t width = end_col > start_col ? end_col - start_col : 1;
  const char marker = label.style == LabelStyle::Primary ? '^' : '-';
  std::string marks(width, marker);
  if (!label.message.empty()) {
    marks += ' ';
    marks += label.message;
  }

  fmt::print(os_, "{} {}", k_gutter, prefix);
  if (use_color_) {
    if (label.style == LabelStyle::Primary) {
      os_ << rang::fg::red << rang::style::bold;
    } else {
      os_ << rang::fg::cyan;
    }
    os_ << marks << rang::style::reset << rang::fg::reset << "\n";
  } else {
    fmt::print(os_, "{}\n", marks);
  }
}

void DiagnosticPrinter::print_note(std::string_view message)
{
  fmt::print(os_, "{}\n", k_gutter);
  if (use_color_) {
    os_ << rang::fg::cyan << rang::style::bold << "      = " << rang::style::reset
        << rang::fg::reset;
    fmt::print(os_, "note: {}\n", message);
  } else {
    fmt::print(os_, "      = note: {}\n", message);
  }
}

std::string DiagnosticPrinter::display_path(const SourceRegistry & sources, FileId id) const
{
  if (!id.is_valid()) {
    return "<unknown>";
  }
  const fs::path & path = sources.get_path(id);
  std::error_code ec;
  const fs::path relative = fs::relative(path, fs::current_path(), ec);
  return (ec || relative.empty()) ? path.string() : relative.string();
}

}  // namespace scssls

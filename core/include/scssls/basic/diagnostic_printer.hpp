// scssls/basic/diagnostic_printer.hpp
//
// Prints diagnostics with source context and position markers.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "scssls/basic/diagnostic.hpp"
#include "scssls/basic/source_manager.hpp"

namespace scssls
{

/**
 * Prints diagnostics in a compiler-style layout:
 *
 *   error[E005]: colon expected
 *     --> styles/main.scss:3:8
 *      |
 *    3 |   $gap 4px;
 *      |        ^^^
 *
 * Secondary labels (tokens skipped during recovery) are underlined with '-'.
 */
class DiagnosticPrinter
{
public:
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print all diagnostics ordered by file and primary location.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

  /// One-line summary such as "2 errors".
  void print_summary(const DiagnosticBag & diags);

private:
  void print_header(const Diagnostic & diag);
  void print_location(const Diagnostic & diag, const SourceRegistry & sources);
  void print_label(const Label & label, const SourceRegistry & sources);
  void print_marker_line(
    std::string_view line, uint32_t start_col, uint32_t end_col, const Label & label);
  void print_note(std::string_view message);

  [[nodiscard]] std::string display_path(const SourceRegistry & sources, FileId id) const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace scssls

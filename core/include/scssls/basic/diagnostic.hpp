// scssls/basic/diagnostic.hpp - Diagnostic types reported by the front end
#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "scssls/basic/source_manager.hpp"

namespace scssls
{

// ============================================================================
// Core Structures
// ============================================================================

enum class LabelStyle : uint8_t {
  Primary,    // the offending source
  Secondary,  // related information (e.g. tokens skipped while recovering)
};

struct Label
{
  SourceRange range;
  std::string message;
  LabelStyle style = LabelStyle::Primary;
};

/// Syntax error with its source labels.
struct Diagnostic
{
  std::string code;  // e.g. "E003"
  std::string message;

  std::vector<Label> labels;

  [[nodiscard]] const Label * primary_label() const noexcept;
  [[nodiscard]] SourceRange primary_range() const noexcept;
};

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Fluent builder that adds the finished diagnostic to its bag on destruction.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;
  DiagnosticBuilder & operator=(DiagnosticBuilder &&) = delete;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);
  DiagnosticBuilder & with_label(
    SourceRange range, std::string msg, LabelStyle style = LabelStyle::Primary);
  DiagnosticBuilder & with_secondary_label(SourceRange range, std::string msg);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBuilder report_error(
    SourceRange range, std::string message, std::string label_message = "");

  void add(Diagnostic && diag);

  [[nodiscard]] const std::vector<Diagnostic> & all() const noexcept { return diagnostics_; }
  [[nodiscard]] bool empty() const noexcept { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return diagnostics_.size(); }


  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace scssls

// scssls/project/project_config.hpp - Project configuration (scssc.yaml)
//
// Parses and validates scssc.yaml project configuration files.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace scssls
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class OutputFormat : uint8_t {
  Text,  ///< rendered diagnostics
  Tree,  ///< indented syntax tree dump
  Json,  ///< syntax tree as JSON
};

enum class ColorMode : uint8_t {
  Auto,  ///< color when stderr is a terminal
  Always,
  Never,
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
};

/**
 * Checker configuration section.
 */
struct CheckConfig
{
  /// Style sheets checked by `scssc check --project`
  std::vector<std::filesystem::path> entry_points;

  /// Syntax diagnostics reported per file
  size_t max_diagnostics = 64;
};

struct OutputConfig
{
  OutputFormat format = OutputFormat::Text;
  ColorMode color = ColorMode::Auto;
};

/**
 * Complete project configuration (scssc.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  CheckConfig check;
  OutputConfig output;

  /// Directory containing scssc.yaml (for resolving relative paths)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a scssc.yaml file.
 *
 * Never throws: unreadable files, malformed YAML and invalid values all
 * produce a failed result with a message.
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Same as load_project_config() for in-memory YAML text.
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to scssc.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "scssc.yaml";

}  // namespace scssls

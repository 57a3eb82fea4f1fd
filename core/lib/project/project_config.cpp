// scssls/project/project_config.cpp - Project configuration implementation
//
#include "scssls/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace scssls
{

namespace
{

ConfigLoadResult build_config(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));  // empty file: all defaults
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'package' section
  if (const auto pkg = root["package"]) {
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
  }

  // Parse 'check' section
  if (const auto check = root["check"]) {
    if (check["entry_points"]) {
      if (!check["entry_points"].IsSequence()) {
        return ConfigLoadResult::fail("check.entry_points must be a list");
      }
      for (const auto & ep : check["entry_points"]) {
        config.check.entry_points.emplace_back(ep.as<std::string>());
      }
    }
    if (check["max_diagnostics"]) {
      const auto limit = check["max_diagnostics"].as<long long>();
      if (limit <= 0) {
        return ConfigLoadResult::fail("check.max_diagnostics must be a positive integer");
      }
      config.check.max_diagnostics = static_cast<size_t>(limit);
    }
  }

  // Parse 'output' section
  if (const auto output = root["output"]) {
    if (output["format"]) {
      const auto format = output["format"].as<std::string>();
      if (format == "text") {
        config.output.format = OutputFormat::Text;
      } else if (format == "tree") {
        config.output.format = OutputFormat::Tree;
      } else if (format == "json") {
        config.output.format = OutputFormat::Json;
      } else {
        return ConfigLoadResult::fail(
          "invalid output.format: '" + format + "' (must be 'text', 'tree' or 'json')");
      }
    }
    if (output["color"]) {
      const auto color = output["color"].as<std::string>();
      if (color == "auto") {
        config.output.color = ColorMode::Auto;
      } else if (color == "always") {
        config.output.color = ColorMode::Always;
      } else if (color == "never") {
        config.output.color = ColorMode::Never;
      } else {
        return ConfigLoadResult::fail(
          "invalid output.color: '" + color + "' (must be 'auto', 'always' or 'never')");
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return build_config(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  const fs::path project_root = fs::absolute(config_path, ec).parent_path();
  try {
    return build_config(YAML::LoadFile(config_path.string()), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::path current = fs::absolute(start_dir, ec);
  if (ec) {
    return std::nullopt;
  }

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current, ec)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate, ec)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;  // filesystem root
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace scssls

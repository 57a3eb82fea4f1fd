// scssc - SCSS syntax checker command line interface
//
// Usage:
//   scssc check [file.scss | --project]
//   scssc dump <file.scss> [--json]
//
#include <fmt/core.h>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "scssls/basic/diagnostic_printer.hpp"
#include "scssls/cst/cst_context.hpp"
#include "scssls/cst/cst_dumper.hpp"
#include "scssls/cst/json_visitor.hpp"
#include "scssls/project/project_config.hpp"
#include "scssls/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  fmt::print(
    stderr,
    "SCSS syntax checker v0.1.0\n\n"
    "Usage: {} <command> [options]\n\n"
    "Commands:\n"
    "  check [file.scss]        Report syntax errors in a file or project\n"
    "  dump <file.scss>         Print the syntax tree of a file\n\n"
    "Options:\n"
    "  --project                Check the entry points listed in scssc.yaml\n"
    "  --json                   Dump the tree as JSON\n"
    "  --no-color               Disable colored diagnostics\n"
    "  -v, --verbose            Verbose output\n"
    "  -h, --help               Show this help message\n",
    program_name);
}

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    return std::nullopt;
  }
  std::ostringstream ss;
  ss << in.rdbuf();
  return ss.str();
}

bool resolve_color(scssls::ColorMode mode)
{
  switch (mode) {
    case scssls::ColorMode::Always:
      return true;
    case scssls::ColorMode::Never:
      return false;
    case scssls::ColorMode::Auto:
      break;
  }
  return isatty(fileno(stderr)) != 0;
}

void print_tree(
  const scssls::ParseOutput & parsed, const scssls::SourceRegistry & sources,
  scssls::OutputFormat format)
{
  if (format == scssls::OutputFormat::Text) {
    return;
  }
  const std::string_view source = sources.get_file(parsed.file_id)->content();
  if (format == scssls::OutputFormat::Json) {
    std::cout << scssls::cst::to_json(parsed.stylesheet, source).dump(2) << "\n";
  } else {
    scssls::cst::dump(parsed.stylesheet, source, std::cout);
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  bool use_project = false;
  bool json = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--project") {
      args.use_project = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (args.input_file.empty()) {
      args.input_file = arg;
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  std::vector<fs::path> files;
  scssls::ParseOptions options;
  scssls::ColorMode color = scssls::ColorMode::Auto;
  scssls::OutputFormat format = scssls::OutputFormat::Text;

  if (args.use_project || args.input_file.empty()) {
    auto config_path = scssls::find_project_config(fs::current_path());
    if (!config_path) {
      fmt::print(stderr, "error: no {} found in current directory or parents\n",
                 scssls::k_project_config_file_name);
      return 1;
    }

    const auto config_result = scssls::load_project_config(*config_path);
    if (!config_result.success) {
      fmt::print(stderr, "error: {}\n", config_result.error);
      return 1;
    }
    const scssls::ProjectConfig & config = config_result.config;

    if (args.verbose) {
      fmt::print(stderr, "Checking project: {}\n", config.package.name);
    }
    for (const auto & entry : config.check.entry_points) {
      files.push_back(entry.is_absolute() ? entry : config.project_root / entry);
    }
    options.max_diagnostics = config.check.max_diagnostics;
    color = config.output.color;
    format = config.output.format;
  } else {
    files.push_back(fs::absolute(args.input_file));
  }
  if (args.no_color) {
    color = scssls::ColorMode::Never;
  }

  scssls::SourceRegistry sources;
  scssls::cst::CstContext ctx;
  scssls::DiagnosticBag diags;

  for (const auto & path : files) {
    auto text = read_file(path);
    if (!text) {
      fmt::print(stderr, "error: file not found: {}\n", path.string());
      return 1;
    }
    if (args.verbose) {
      fmt::print(stderr, "Checking: {}\n", path.string());
    }
    const scssls::ParseOutput parsed =
      scssls::parse_source(sources, path, std::move(*text), ctx, diags, options);
    print_tree(parsed, sources, format);
  }

  if (!diags.empty()) {
    scssls::DiagnosticPrinter printer(std::cerr, resolve_color(color));
    printer.print_all(diags, sources);
    printer.print_summary(diags);
    return 1;
  }
  fmt::print("{}: OK\n", args.input_file.empty() ? "project" : args.input_file);
  return 0;
}

int cmd_dump(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    fmt::print(stderr, "error: dump requires a file\n");
    return 1;
  }
  const fs::path path = fs::absolute(args.input_file);
  auto text = read_file(path);
  if (!text) {
    fmt::print(stderr, "error: file not found: {}\n", path.string());
    return 1;
  }

  scssls::SourceRegistry sources;
  scssls::cst::CstContext ctx;
  scssls::DiagnosticBag diags;
  const scssls::ParseOutput parsed =
    scssls::parse_source(sources, path, std::move(*text), ctx, diags);
  print_tree(parsed, sources, args.json ? scssls::OutputFormat::Json : scssls::OutputFormat::Tree);

  if (args.verbose) {
    fmt::print(stderr, "{} nodes, {} diagnostics\n", ctx.node_count(), diags.size());
  }
  return diags.empty() ? 0 : 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "dump") {
    return cmd_dump(args);
  }

  fmt::print(stderr, "error: unknown command '{}'\n", args.command);
  print_usage(argv[0]);
  return 1;
}

// dmlc - Data Modeling Language resolver command line interface
//
// Usage:
//   dmlc check [model.json ...]
//   dmlc dump [model.json ...] [-o output.json]
//
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <fmt/core.h>
#include <fmt/ostream.h>

#include "dml/basic/diagnostic_printer.hpp"
#include "dml/driver/resolver.hpp"
#include "dml/model/model_dumper.hpp"
#include "dml/model/model_loader.hpp"
#include "dml/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "DML Resolver v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [files...] [options]\n\n"
            << "Commands:\n"
            << "  check [files...]         Resolve and report diagnostics\n"
            << "  dump [files...]          Resolve and write the resolved model as JSON\n\n"
            << "Without files, the sources listed in dml.yaml are used.\n\n"
            << "Options:\n"
            << "  -o, --output <path>      Output file for dump (default: stdout)\n"
            << "  --config <path>          Use this dml.yaml instead of searching for one\n"
            << "  --test-mode              Deterministic message texts\n"
            << "  -v, --verbose            Print phase timings and counts\n"
            << "  -h, --help               Show this help message\n";
}

void print_diagnostics(const dml::DiagnosticBag & diagnostics, const dml::Model & model)
{
  const bool use_color = isatty(fileno(stderr)) != 0;
  dml::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics, model.files());
}

void print_stats(const dml::ResolveStats & stats)
{
  static constexpr const char * k_phase_names[dml::ResolveStats::k_phase_count] = {
    "usings", "populate", "keys", "references", "associations", "cycles",
  };
  fmt::print(std::cerr, "definitions: {} ({} autoexposed)\n", stats.definitions, stats.autoexposed);
  fmt::print(std::cerr, "cyclic references: {}\n", stats.cyclic_references);
  for (size_t i = 0; i < stats.phase_ms.size(); ++i) {
    fmt::print(std::cerr, "  phase {} {:<13} {:>8.3f} ms\n", i + 1, k_phase_names[i], stats.phase_ms[i]);
  }
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> input_files;
  std::string output_path;
  std::string config_path;
  bool test_mode = false;
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
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (i + 1 < argc) {
        args.output_path = argv[++i];
      }
    } else if (arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "--test-mode") {
      args.test_mode = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-') {
      args.input_files.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

/// Configuration from --config, a dml.yaml found upward, or defaults.
bool load_config(const CommandArgs & args, dml::ProjectConfig & config)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = dml::find_project_config(fs::current_path());
  }
  if (!config_path) {
    config.project_root = fs::current_path();
    return true;
  }

  auto result = dml::load_project_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return false;
  }
  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  config = std::move(result.config);
  return true;
}

int cmd_resolve(const CommandArgs & args, bool dump)
{
  dml::ProjectConfig config;
  if (!load_config(args, config)) {
    return 1;
  }
  if (args.test_mode) {
    config.resolver.test_mode = true;
  }

  std::vector<fs::path> inputs;
  for (const auto & f : args.input_files) {
    inputs.push_back(fs::absolute(f));
  }
  if (inputs.empty()) {
    inputs = config.sources;
  }
  if (inputs.empty()) {
    std::cerr << "error: no input files and no sources in " << dml::k_project_config_file_name
              << "\n";
    return 1;
  }

  dml::Model model;
  dml::DiagnosticBag diagnostics;
  dml::ModelLoader loader(model, diagnostics);
  for (const auto & path : inputs) {
    if (!fs::exists(path)) {
      std::cerr << "error: file not found: " << path.string() << "\n";
      return 1;
    }
    if (args.verbose) {
      std::cerr << "Loading: " << path.string() << "\n";
    }
    const auto loaded = loader.add_file(path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return 1;
    }
  }
  loader.finish();

  bool success = false;
  try {
    dml::Resolver resolver(model, diagnostics, config.resolver);
    success = resolver.run();
    if (args.verbose) {
      print_stats(resolver.stats());
    }
  } catch (const dml::InternalError & e) {
    if (!diagnostics.empty()) {
      print_diagnostics(diagnostics, model);
    }
    std::cerr << "internal error: " << e.what() << "\n";
    return 2;
  }

  if (!diagnostics.empty()) {
    print_diagnostics(diagnostics, model);
  }

  if (dump) {
    const std::string text = dml::to_json(model).dump(2);
    if (args.output_path.empty()) {
      std::cout << text << "\n";
    } else {
      std::ofstream out(args.output_path);
      if (!out.is_open()) {
        std::cerr << "error: failed to open output file: " << args.output_path << "\n";
        return 1;
      }
      out << text << "\n";
      if (args.verbose) {
        std::cerr << "Written: " << args.output_path << "\n";
      }
    }
  } else if (success) {
    std::cout << inputs.size() << (inputs.size() == 1 ? " file" : " files") << ": OK\n";
  }

  return success ? 0 : 1;
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
    return cmd_resolve(args, false);
  }

  if (args.command == "dump") {
    return cmd_resolve(args, true);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}

// tlc - typed lambda calculus checker command line interface
//
// Usage:
//   tlc run [sample...] [--format text|json] [--config tlc.yaml] [--dump] [--no-color] [-v]
//   tlc list
//
#include <filesystem>
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

#include "tlc/ast/ast_dumper.hpp"
#include "tlc/basic/diagnostic_printer.hpp"
#include "tlc/driver/samples.hpp"
#include "tlc/driver/session.hpp"
#include "tlc/project/project_config.hpp"
#include "tlc/sema/types/type.hpp"
#include "tlc/sema/types/type_utils.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "tlc - typed lambda calculus checker v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  run [sample...]          Type the given samples (default: all)\n"
            << "  list                     List the built-in samples\n\n"
            << "Options:\n"
            << "  --format <text|json>     Output format (default: text)\n"
            << "  --config <path>          Use this tlc.yaml instead of searching for one\n"
            << "  --dump                   Print each expression tree (text output only)\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> samples;
  std::optional<std::string> format;
  std::string config_path;
  bool dump = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
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

    if (arg == "--format") {
      if (i + 1 >= argc) {
        args.error = "--format requires a value";
        return args;
      }
      args.format = argv[++i];
    } else if (arg == "--config") {
      if (i + 1 >= argc) {
        args.error = "--config requires a path";
        return args;
      }
      args.config_path = argv[++i];
    } else if (arg == "--dump") {
      args.dump = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
      return args;
    } else {
      args.samples.push_back(arg);
    }
  }

  return args;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_list()
{
  for (const auto & spec : tlc::builtin_samples()) {
    std::cout << spec.name << "\t" << spec.description << "\n";
  }
  return 0;
}

int cmd_run(const CommandArgs & args)
{
  tlc::TypeContext types;
  tlc::ProjectConfig config;

  // Configuration: explicit path, else search upward; absence is fine.
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = tlc::find_project_config(fs::current_path());
  }

  if (config_path) {
    auto loaded = tlc::load_project_config(*config_path, types);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return 1;
    }
    config = std::move(loaded.config);
    if (args.verbose) {
      std::cerr << "Using configuration: " << config_path->string() << "\n";
    }
  }

  tlc::OutputFormat format = config.output.format;
  if (args.format) {
    if (*args.format == "text") {
      format = tlc::OutputFormat::Text;
    } else if (*args.format == "json") {
      format = tlc::OutputFormat::Json;
    } else {
      std::cerr << "error: invalid --format '" << *args.format << "' (must be 'text' or 'json')\n";
      return 1;
    }
  }

  bool use_color = isatty(fileno(stderr)) != 0;
  if (config.output.color == tlc::ColorMode::Always) use_color = true;
  if (config.output.color == tlc::ColorMode::Never || args.no_color) use_color = false;

  tlc::RunOptions options;
  options.samples = args.samples.empty() ? config.samples : args.samples;
  options.verbose = args.verbose;
  for (const auto & b : config.context) {
    options.base_bindings.push_back(tlc::Binding{b.name, b.type});
  }

  tlc::Session session(types);
  const tlc::RunReport report = session.run(options);

  if (format == tlc::OutputFormat::Json) {
    std::cout << tlc::to_json(report).dump(2) << "\n";
  } else {
    tlc::AstDumper dumper(std::cout);
    for (const auto & entry : report.entries) {
      if (entry.type_only) {
        std::cout << "Type: " << entry.subject << "\n\n";
        continue;
      }
      std::cout << "Expression: " << entry.subject << "\n";
      if (args.dump) {
        dumper.dump(entry.expr);
      }
      if (entry.result.success) {
        std::cout << "Type: " << tlc::to_string(entry.result.type) << "\n\n";
      } else {
        std::cout << "Type Error: " << entry.result.error.message() << "\n\n";
      }
    }
  }

  if (!report.diagnostics.empty()) {
    tlc::DiagnosticPrinter printer(std::cerr, use_color);
    printer.print_all(report.diagnostics);
  }

  return report.success() ? 0 : 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.command == "run") {
    return cmd_run(args);
  }

  if (args.command == "list") {
    return cmd_list();
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}

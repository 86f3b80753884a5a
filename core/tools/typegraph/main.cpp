// typegraph - Type graph extractor Command Line Interface
//
// Usage:
//   typegraph extract <symbols.json> [-o output] [-f format] [options]
//   typegraph check <symbols.json> [--target <module>]
//   typegraph init [directory]
//
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "typegraph/basic/diagnostic_printer.hpp"
#include "typegraph/basic/logging.hpp"
#include "typegraph/driver/extraction_driver.hpp"
#include "typegraph/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "typegraph v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  extract <symbols.json>        Extract the target module's type graph\n"
            << "  check <symbols.json>          Load and validate a symbol dump\n"
            << "  init [directory]              Write a default typegraph.yaml\n\n"
            << "Options:\n"
            << "  -o, --output <path>           Output file ('-' for stdout)\n"
            << "  -f, --format <fmt>            ntriples | turtle\n"
            << "  -b, --base-uri <uri>          Base IRI of minted identifiers\n"
            << "  --target <module>             Module to extract (overrides the dump)\n"
            << "  --include-private             Include private types and members\n"
            << "  --exclude-internal            Exclude internal types and members\n"
            << "  --include-compiler-generated  Include compiler-generated symbols\n"
            << "  --exclude-attributes          Do not extract attribute instances\n"
            << "  --exclude-external-types      Do not describe referenced external types\n"
            << "  --no-exceptions               Do not emit throws edges\n"
            << "  --no-seealso                  Do not emit relatedTo edges\n"
            << "  --config <path>               Use this typegraph.yaml\n"
            << "  -v, --verbose                 Verbose output\n"
            << "  -q, --quiet                   Only warnings and errors\n"
            << "  -h, --help                    Show this help message\n";
}

void print_diagnostics(const typegraph::DiagnosticBag & diagnostics)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  typegraph::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(diagnostics);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  std::optional<std::string> output_path;
  std::optional<std::string> format;
  std::optional<std::string> base_uri;
  std::optional<std::string> target;
  std::optional<std::string> config_path;
  bool include_private = false;
  bool exclude_internal = false;
  bool include_compiler_generated = false;
  bool exclude_attributes = false;
  bool exclude_external_types = false;
  bool no_exceptions = false;
  bool no_see_also = false;
  bool verbose = false;
  bool quiet = false;
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

  const auto take_value = [&](int & i, std::optional<std::string> & slot, const std::string & flag) {
    if (i + 1 < argc) {
      slot = argv[++i];
    } else {
      args.error = "missing value for " + flag;
    }
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      take_value(i, args.output_path, arg);
    } else if (arg == "-f" || arg == "--format") {
      take_value(i, args.format, arg);
    } else if (arg == "-b" || arg == "--base-uri") {
      take_value(i, args.base_uri, arg);
    } else if (arg == "--target") {
      take_value(i, args.target, arg);
    } else if (arg == "--config") {
      take_value(i, args.config_path, arg);
    } else if (arg == "--include-private") {
      args.include_private = true;
    } else if (arg == "--exclude-internal") {
      args.exclude_internal = true;
    } else if (arg == "--include-compiler-generated") {
      args.include_compiler_generated = true;
    } else if (arg == "--exclude-attributes") {
      args.exclude_attributes = true;
    } else if (arg == "--exclude-external-types") {
      args.exclude_external_types = true;
    } else if (arg == "--no-exceptions") {
      args.no_exceptions = true;
    } else if (arg == "--no-seealso") {
      args.no_see_also = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-q" || arg == "--quiet") {
      args.quiet = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "-" || (arg[0] != '-' && args.input_file.empty())) {
      args.input_file = arg;
    } else {
      args.error = "unknown option '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

/// Project file values, then command-line overrides
std::optional<typegraph::RunOptions> build_run_options(
  const CommandArgs & args, typegraph::RunMode mode)
{
  typegraph::ProjectConfig config;

  std::optional<fs::path> config_path;
  if (args.config_path) {
    config_path = fs::path(*args.config_path);
  } else {
    config_path = typegraph::find_project_config(fs::current_path());
  }

  if (config_path) {
    const auto loaded = typegraph::load_project_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << loaded.error << "\n";
      return std::nullopt;
    }
    config = loaded.config;
  }

  typegraph::LogLevel level = config.log_level;
  if (args.verbose) level = typegraph::LogLevel::Verbose;
  if (args.quiet) level = typegraph::LogLevel::Quiet;
  typegraph::configure_logging(level);

  if (config_path) {
    spdlog::debug("[CLI] Using configuration {}", config_path->string());
  }

  typegraph::RunOptions options;
  options.mode = mode;
  options.input = args.input_file;
  options.extraction = config.extraction;
  options.format = config.output.format;
  if (!config.output.path.empty()) {
    options.output = config.output.path.is_absolute()
                       ? config.output.path
                       : config.project_root / config.output.path;
  }

  if (args.output_path) options.output = fs::path(*args.output_path);
  if (args.target) options.target_module = *args.target;
  if (args.base_uri) options.extraction.base_uri = *args.base_uri;
  if (args.format) {
    options.format = typegraph::parse_output_format(*args.format);
    if (!options.format) {
      std::cerr << "error: unknown output format '" << *args.format
                << "' (must be 'ntriples' or 'turtle')\n";
      return std::nullopt;
    }
  }

  auto & ex = options.extraction;
  if (args.include_private) ex.include_private = true;
  if (args.exclude_internal) ex.include_internal = false;
  if (args.include_compiler_generated) ex.include_compiler_generated = true;
  if (args.exclude_attributes) ex.include_attributes = false;
  if (args.exclude_external_types) ex.include_external_types = false;
  if (args.no_exceptions) ex.extract_exceptions = false;
  if (args.no_see_also) ex.extract_see_also = false;

  return options;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_run(const CommandArgs & args, typegraph::RunMode mode)
{
  if (args.input_file.empty()) {
    std::cerr << "error: symbol dump required\n";
    std::cerr << "usage: typegraph " << args.command << " <symbols.json>\n";
    return 1;
  }

  const auto options = build_run_options(args, mode);
  if (!options) {
    return 1;
  }

  const typegraph::RunResult result = typegraph::ExtractionDriver::run(*options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result.diagnostics);
  }

  if (!result.success) {
    return 1;
  }

  if (mode == typegraph::RunMode::Check) {
    std::cout << args.input_file << ": OK\n";
  } else if (result.output_file) {
    spdlog::info(
      "[CLI] Wrote {} ({} types, {} triples)", result.output_file->string(),
      result.stats.types_extracted, result.stats.facts_emitted);
  }
  return 0;
}

int cmd_init(const CommandArgs & args)
{
  const fs::path project_dir = args.input_file.empty() ? fs::current_path()
                                                       : fs::current_path() / args.input_file;
  const fs::path config_path = project_dir / typegraph::k_project_config_file_name;

  if (fs::exists(config_path)) {
    std::cerr << "error: file already exists: " << config_path.string() << "\n";
    return 1;
  }

  std::error_code ec;
  fs::create_directories(project_dir, ec);
  if (ec) {
    std::cerr << "error: " << ec.message() << "\n";
    return 1;
  }

  std::ofstream config(config_path);
  if (!config.is_open()) {
    std::cerr << "error: failed to create " << config_path.string() << "\n";
    return 1;
  }
  config << typegraph::render_project_config(typegraph::ProjectConfig{});
  config.close();

  std::cout << "Wrote " << config_path.string() << "\n";
  std::cout << "\nNext step:\n"
            << "  typegraph extract <symbols.json>\n";
  return 0;
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

  if (args.command == "extract") {
    return cmd_run(args, typegraph::RunMode::Extract);
  }

  if (args.command == "check") {
    return cmd_run(args, typegraph::RunMode::Check);
  }

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}

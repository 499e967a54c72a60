// giftc - GIFT <-> JSON converter command line interface
//
// Usage:
//   giftc parse  <input.gift> [output.json]
//   giftc export <input.json> [output.gift]
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

#include "gift/basic/diagnostic_printer.hpp"
#include "gift/driver/converter.hpp"
#include "gift/project/config.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_usage = 1;
constexpr int k_exit_failure = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "GIFT converter v0.1.0\n\n"
            << "Usage: " << program_name << " <command> <input> [output] [options]\n\n"
            << "Commands:\n"
            << "  parse <input.gift> [output.json]   Convert GIFT to JSON\n"
            << "  export <input.json> [output.gift]  Convert JSON to GIFT\n\n"
            << "Options:\n"
            << "  -c, --config <giftc.yaml>  Use this configuration file\n"
            << "  -v, --verbose              Verbose output\n"
            << "  -h, --help                 Show this help message\n\n"
            << "Without an output path the result is written to stdout.\n";
}

void print_diagnostics(const gift::ConvertResult & result)
{
  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  gift::DiagnosticPrinter printer(std::cerr, use_color);

  const bool has_source = !result.source.path().empty();
  printer.print_all(result.diagnostics, has_source ? &result.source : nullptr);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::vector<std::string> positional;
  std::string config_path;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.error = "missing command";
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-c" || arg == "--config") {
      if (i + 1 >= argc) {
        args.error = "option '" + arg + "' requires a path";
        return args;
      }
      args.config_path = argv[++i];
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
      return args;
    } else {
      args.positional.push_back(arg);
    }
  }

  if (args.positional.empty()) {
    args.error = "missing input file";
  } else if (args.positional.size() > 2) {
    args.error = "too many arguments";
  }

  return args;
}

// ============================================================================
// Configuration
// ============================================================================

/// --config wins; otherwise giftc.yaml in the current directory or a parent.
bool load_configuration(const CommandArgs & args, gift::GiftConfig & config)
{
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::path(args.config_path);
  } else {
    config_path = gift::find_config(fs::current_path());
  }

  if (!config_path) {
    return true;
  }

  const auto result = gift::load_config(*config_path);
  if (!result.success) {
    std::cerr << "error: " << result.error << "\n";
    return false;
  }

  if (args.verbose) {
    std::cerr << "Using configuration: " << config_path->string() << "\n";
  }
  config = result.config;
  return true;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_convert(const CommandArgs & args, gift::ConvertMode mode)
{
  gift::ConvertOptions options;
  options.mode = mode;
  options.verbose = args.verbose;
  if (!load_configuration(args, options.config)) {
    return k_exit_failure;
  }
  if (args.positional.size() > 1) {
    options.output_path = fs::path(args.positional[1]);
  }

  const fs::path input_path = args.positional[0];
  if (args.verbose) {
    std::cerr << (mode == gift::ConvertMode::Parse ? "Parsing: " : "Exporting: ")
              << input_path.string() << "\n";
  }

  const gift::ConvertResult result = gift::Converter::convert_file(input_path, options);

  if (!result.diagnostics.empty()) {
    print_diagnostics(result);
  }

  if (!result.success) {
    return k_exit_failure;
  }

  if (options.output_path) {
    if (args.verbose) {
      std::cerr << "Wrote " << result.question_count << " questions to "
                << options.output_path->string() << "\n";
    }
  } else {
    std::cout << result.output;
    if (mode == gift::ConvertMode::Parse) {
      std::cout << "\n";
    }
  }

  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.command == "parse") {
    return cmd_convert(args, gift::ConvertMode::Parse);
  }

  if (args.command == "export") {
    return cmd_convert(args, gift::ConvertMode::Export);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return k_exit_usage;
}

// hclfmt - HCL formatter command line interface
//
// Usage:
//   hclfmt [options] [file...]
//
// Reads standard input when no file is given.
//
#include <fmt/core.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
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

#include "hcl/ast/json_visitor.hpp"
#include "hcl/basic/diagnostic_printer.hpp"
#include "hcl/format/formatter.hpp"
#include "hcl/project/format_config.hpp"
#include "hcl/syntax/frontend.hpp"

namespace fs = std::filesystem;

namespace
{

// Exit codes
constexpr int k_exit_ok = 0;
constexpr int k_exit_failure = 1;  // parse error, unformatted input (--check)
constexpr int k_exit_error = 2;    // usage, configuration or I/O error

constexpr const char * k_stdin_name = "<stdin>";

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  fmt::print(
    stderr,
    "hclfmt v0.1.0\n\n"
    "Usage: {} [options] [file...]\n\n"
    "Formats HCL files. Reads standard input when no file is given.\n\n"
    "Options:\n"
    "  --check                  Exit with status 1 if any input is not formatted\n"
    "  -w, --write              Rewrite files in place\n"
    "  --json                   Print the parsed model as JSON\n"
    "  --expr                   Treat the input as a single expression\n"
    "  --config <path>          Use this configuration file instead of searching\n"
    "                           for {} upward from the working directory\n"
    "  --no-color               Disable colored diagnostics\n"
    "  -v, --verbose            Verbose output\n"
    "  -h, --help               Show this help message\n",
    program_name, hcl::k_format_config_file_name);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::vector<std::string> files;
  std::string config_path;
  bool check = false;
  bool write = false;
  bool json = false;
  bool expr = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;

  /// Set when the command line is invalid
  std::string error;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--check") {
      args.check = true;
    } else if (arg == "-w" || arg == "--write") {
      args.write = true;
    } else if (arg == "--json") {
      args.json = true;
    } else if (arg == "--expr") {
      args.expr = true;
    } else if (arg == "--config") {
      if (i + 1 >= argc) {
        args.error = "--config requires a path";
        return args;
      }
      args.config_path = argv[++i];
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg.size() > 1 && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
      return args;
    } else {
      args.files.push_back(arg);
    }
  }

  if (args.write && args.files.empty()) {
    args.error = "--write requires at least one file";
  } else if (args.json && (args.check || args.write)) {
    args.error = "--json cannot be combined with --check or --write";
  } else if (args.check && args.write) {
    args.error = "--check cannot be combined with --write";
  }

  return args;
}

// ============================================================================
// Input / Output
// ============================================================================

std::optional<std::string> read_input(const std::string & name)
{
  if (name == "-" || name == k_stdin_name) {
    return std::string(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }

  std::ifstream file(name, std::ios::binary);
  if (!file.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  if (file.bad()) {
    return std::nullopt;
  }
  return buffer.str();
}

std::optional<hcl::FormatConfig> load_config(const CommandArgs & args)
{
  std::optional<fs::path> path;
  if (!args.config_path.empty()) {
    path = args.config_path;
  } else {
    path = hcl::find_format_config(fs::current_path());
  }

  if (!path) {
    if (args.verbose) {
      fmt::print(stderr, "hclfmt: no {} found, using defaults\n", hcl::k_format_config_file_name);
    }
    return hcl::FormatConfig{};
  }

  const auto result = hcl::load_format_config(*path);
  if (!result.success) {
    fmt::print(stderr, "error: {}\n", result.error);
    return std::nullopt;
  }
  if (args.verbose) {
    fmt::print(stderr, "hclfmt: using configuration {}\n", path->string());
  }
  return result.config;
}

// ============================================================================
// Processing
// ============================================================================

class FileProcessor
{
public:
  FileProcessor(const CommandArgs & args, hcl::FormatConfig config)
  : args_(args),
    config_(std::move(config)),
    use_color_(!args.no_color && isatty(fileno(stderr)) != 0)
  {
  }

  int process(const std::string & name)
  {
    if (args_.verbose) {
      fmt::print(stderr, "hclfmt: reading {}\n", name);
    }

    const auto text = read_input(name);
    if (!text) {
      fmt::print(stderr, "error: failed to read {}\n", name);
      return k_exit_error;
    }

    if (args_.expr) {
      auto expr = hcl::parse_expression(*text, config_.parser);
      if (!expr) {
        report(name, expr.error(), *text);
        return k_exit_failure;
      }
      return emit(name, *text, *expr, true);
    }

    auto body = hcl::parse_body(*text, config_.parser);
    if (!body) {
      report(name, body.error(), *text);
      return k_exit_failure;
    }
    return emit(name, *text, *body, false);
  }

private:
  void report(const std::string & name, const hcl::ParseError & err, const std::string & text)
  {
    fmt::print(stderr, "{}:\n", name);
    std::cerr.flush();
    hcl::DiagnosticPrinter printer(std::cerr, use_color_);
    printer.print(err, text);
    std::cerr << "\n";
  }

  template <typename Node>
  int emit(const std::string & name, const std::string & text, const Node & node, bool add_newline)
  {
    if (args_.json) {
      fmt::print("{}\n", hcl::to_json(node).dump(2));
      return k_exit_ok;
    }

    std::string formatted = hcl::to_string(node, config_.format);
    if (add_newline) {
      formatted.push_back('\n');
    }

    if (args_.check) {
      if (formatted != text) {
        fmt::print(stderr, "{}: not formatted\n", name);
        return k_exit_failure;
      }
      if (args_.verbose) {
        fmt::print(stderr, "hclfmt: {} is formatted\n", name);
      }
      return k_exit_ok;
    }

    if (args_.write) {
      if (formatted == text) {
        return k_exit_ok;
      }
      std::ofstream out(name, std::ios::binary | std::ios::trunc);
      if (!out.is_open()) {
        fmt::print(stderr, "error: failed to open {} for writing\n", name);
        return k_exit_error;
      }
      return write_to(out, name, node, add_newline);
    }

    std::cout.flush();
    return write_to(std::cout, name, node, add_newline);
  }

  template <typename Node>
  int write_to(std::ostream & os, const std::string & name, const Node & node, bool add_newline)
  {
    const auto written = hcl::format_to(os, node, config_.format);
    if (!written) {
      fmt::print(stderr, "error: {}: {}\n", name, written.error());
      return k_exit_error;
    }
    if (add_newline) {
      os << '\n';
    }
    os.flush();
    if (!os) {
      fmt::print(stderr, "error: {}: failed to write output\n", name);
      return k_exit_error;
    }
    if (args_.verbose && args_.write) {
      fmt::print(stderr, "hclfmt: rewrote {}\n", name);
    }
    return k_exit_ok;
  }

  const CommandArgs & args_;
  hcl::FormatConfig config_;
  bool use_color_;
};

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_ok;
  }

  if (!args.error.empty()) {
    fmt::print(stderr, "error: {}\n", args.error);
    print_usage(argv[0]);
    return k_exit_error;
  }

  auto config = load_config(args);
  if (!config) {
    return k_exit_error;
  }

  FileProcessor processor(args, std::move(*config));

  std::vector<std::string> inputs = args.files;
  if (inputs.empty()) {
    inputs.emplace_back(k_stdin_name);
  }

  int status = k_exit_ok;
  for (const auto & name : inputs) {
    status = std::max(status, processor.process(name));
  }
  return status;
}

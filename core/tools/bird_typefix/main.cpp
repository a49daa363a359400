// bird-typefix - BIRD filter return-type annotation tool
//
// Usage:
//   bird-typefix <file.conf | directory> [options]
//
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "bird_typefix/basic/diagnostic_printer.hpp"
#include "bird_typefix/driver/batch_runner.hpp"
#include "bird_typefix/driver/messages.hpp"
#include "bird_typefix/project/tool_config.hpp"
#include "bird_typefix/report/json_report.hpp"
#include "bird_typefix/report/scan_diagnostics.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_option(std::string_view flags, std::string_view help)
{
  std::cerr << "  " << flags;
  for (size_t i = flags.size(); i < 25; ++i) {
    std::cerr << ' ';
  }
  std::cerr << help << "\n";
}

void print_usage(const char * program_name, const bird_typefix::Messages & m)
{
  namespace msg = bird_typefix::msg;

  std::cerr << "bird-typefix v0.1.0 - " << m.get(msg::k_title) << "\n\n"
            << m.get(msg::k_usage) << ": " << program_name << " " << m.get(msg::k_usage_args)
            << "\n\n"
            << m.get(msg::k_print_note) << "\n\n"
            << m.get(msg::k_options) << ":\n";
  print_option("-i, --in-place", m.get(msg::k_opt_in_place));
  print_option("-b, --backup <suffix>", m.get(msg::k_opt_backup));
  print_option("-j, --jobs <n>", m.get(msg::k_opt_jobs));
  print_option("--no-recursive", m.get(msg::k_opt_no_recursive));
  print_option("--ext <suffix>", m.get(msg::k_opt_ext));
  print_option("--config <path>", m.get(msg::k_opt_config));
  print_option("--report <text|json>", m.get(msg::k_opt_report));
  print_option("--no-color", m.get(msg::k_opt_no_color));
  print_option("-v, --verbose", m.get(msg::k_opt_verbose));
  print_option("-h, --help", m.get(msg::k_opt_help));

  std::cerr << "\n"
            << m.get(msg::k_supported_types) << ":\n"
            << "  int:     return 1;\n"
            << "  pair:    return (1, 2);        ->  pair (int, int)\n"
            << "  ip:      return 1.2.3.4;\n"
            << "  prefix:  return 1.2.3.4/32;    return net;\n"
            << "  string:  return \"hello\";\n"
            << "  set:     return {1, 2, 3};\n"
            << "  bool:    return true;          return a > b;\n\n"
            << m.get(msg::k_void_note) << "\n"
            << m.get(msg::k_exit_status) << "\n";
}

void print_file_diagnostics(
  const bird_typefix::FileResult & file, bool verbose, const bird_typefix::Messages & m,
  bird_typefix::DiagnosticPrinter & printer)
{
  if (!file.success) {
    std::cerr << m.format(bird_typefix::msg::k_error, file.error) << "\n";
    return;
  }
  const bird_typefix::DiagnosticBag diags = bird_typefix::to_diagnostics(file.report, verbose);
  printer.print_all(diags, file.source);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string input_path;
  std::optional<std::string> config_path;
  std::optional<std::string> backup_suffix;
  std::optional<std::string> report;
  std::optional<uint32_t> jobs;
  std::vector<std::string> extensions;
  bool in_place = false;
  bool no_recursive = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
  std::string error;
};

std::optional<uint32_t> parse_jobs(const std::string & text)
{
  if (text.empty() || text.size() > 4) {
    return std::nullopt;
  }
  uint32_t value = 0;
  for (const char c : text) {
    if (c < '0' || c > '9') {
      return std::nullopt;
    }
    value = value * 10 + static_cast<uint32_t>(c - '0');
  }
  return value;
}

CommandArgs parse_args(int argc, char * argv[], const bird_typefix::Messages & m)
{
  namespace msg = bird_typefix::msg;

  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    auto take_value = [&](std::string & out) {
      if (i + 1 >= argc) {
        args.error = m.format(msg::k_missing_value, arg);
        return false;
      }
      out = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "-i" || arg == "--in-place") {
      args.in_place = true;
    } else if (arg == "-b" || arg == "--backup") {
      if (!take_value(value)) {
        return args;
      }
      args.backup_suffix = value;
    } else if (arg == "-j" || arg == "--jobs") {
      if (!take_value(value)) {
        return args;
      }
      args.jobs = parse_jobs(value);
      if (!args.jobs) {
        args.error = m.format(msg::k_invalid_jobs, value);
        return args;
      }
    } else if (arg == "--no-recursive") {
      args.no_recursive = true;
    } else if (arg == "--ext") {
      if (!take_value(value)) {
        return args;
      }
      if (value.empty() || value.front() != '.') {
        args.error = m.format(msg::k_invalid_extension, value);
        return args;
      }
      args.extensions.push_back(value);
    } else if (arg == "--config") {
      if (!take_value(value)) {
        return args;
      }
      args.config_path = value;
    } else if (arg == "--report") {
      if (!take_value(value)) {
        return args;
      }
      args.report = value;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = m.format(msg::k_unknown_option, arg);
      return args;
    } else if (args.input_path.empty()) {
      args.input_path = arg;
    } else {
      args.error = m.format(msg::k_unexpected_argument, arg);
      return args;
    }
  }

  if (!args.show_help && args.input_path.empty()) {
    args.error = std::string(m.get(msg::k_missing_input));
  }
  return args;
}

// ============================================================================
// Configuration
// ============================================================================

/// bird-typefix.yaml (explicit or found upward), then command-line overrides.
bird_typefix::ConfigLoadResult resolve_config(
  const CommandArgs & args, const bird_typefix::Messages & m)
{
  bird_typefix::ToolConfig config;

  std::optional<fs::path> config_file;
  if (args.config_path) {
    config_file = fs::path(*args.config_path);
  } else {
    config_file = bird_typefix::find_tool_config(args.input_path);
  }

  if (config_file) {
    auto loaded = bird_typefix::load_tool_config(*config_file);
    if (!loaded.success) {
      return loaded;
    }
    config = std::move(loaded.config);
  }

  if (!args.extensions.empty()) {
    config.extensions = args.extensions;
  }
  if (args.no_recursive) {
    config.recursive = false;
  }
  if (args.jobs) {
    config.jobs = *args.jobs;
  }
  if (args.backup_suffix) {
    config.backup_suffix = *args.backup_suffix;
  }
  if (args.report) {
    const auto format = bird_typefix::parse_report_format(*args.report);
    if (!format) {
      return bird_typefix::ConfigLoadResult::fail(
        m.format(bird_typefix::msg::k_invalid_report, *args.report));
    }
    config.report = *format;
  }

  return bird_typefix::ConfigLoadResult::ok(std::move(config));
}

// ============================================================================
// Command
// ============================================================================

int cmd_run(const CommandArgs & args, const bird_typefix::Messages & m)
{
  namespace msg = bird_typefix::msg;

  const fs::path input_path = args.input_path;

  // A missing input is reported before any configuration lookup.
  std::error_code ec;
  if (!fs::exists(input_path, ec)) {
    std::cerr << m.format(msg::k_path_not_found, input_path.string()) << "\n";
    return 1;
  }

  const auto config_result = resolve_config(args, m);
  if (!config_result.success) {
    std::cerr << m.format(msg::k_error, config_result.error) << "\n";
    return 1;
  }

  bird_typefix::RunOptions options;
  options.mode = args.in_place ? bird_typefix::RunMode::InPlace : bird_typefix::RunMode::Print;
  options.config = config_result.config;
  options.verbose = args.verbose;

  if (args.verbose && !options.config.source_path.empty()) {
    std::cerr << m.format(msg::k_using_config, options.config.source_path.string()) << "\n";
  }

  const auto collected = bird_typefix::BatchRunner::collect_files(input_path, options.config);
  if (!collected.success) {
    std::cerr << m.format(msg::k_error, collected.error) << "\n";
    return 1;
  }

  if (collected.files.empty()) {
    std::cerr << m.format(msg::k_no_matching_files, input_path.string()) << "\n";
    return 0;
  }

  const auto result = bird_typefix::BatchRunner::run(collected.files, options);

  if (options.config.report == bird_typefix::ReportFormat::Json) {
    std::cout << bird_typefix::dump_json(bird_typefix::batch_to_json(result)) << "\n";
    return static_cast<int>(result.exit_status());
  }

  const bool use_color = !args.no_color && isatty(fileno(stderr)) != 0;
  bird_typefix::DiagnosticPrinter printer(std::cerr, use_color);
  for (const auto & file : result.files) {
    print_file_diagnostics(file, args.verbose, m, printer);
  }

  if (options.mode == bird_typefix::RunMode::Print) {
    bird_typefix::write_text_output(result, collected.is_directory, std::cout);
  } else {
    for (const auto & file : result.files) {
      if (file.written) {
        std::cerr << m.format(msg::k_done, file.path.string()) << "\n";
      }
    }
  }

  return static_cast<int>(result.exit_status());
}

}  // namespace

int main(int argc, char * argv[])
{
  const bird_typefix::Messages messages(bird_typefix::detect_language_from_environment());
  const CommandArgs args = parse_args(argc, argv, messages);

  if (args.show_help) {
    print_usage(argv[0], messages);
    return 0;
  }

  if (!args.error.empty()) {
    std::cerr << messages.format(bird_typefix::msg::k_error, args.error) << "\n";
    print_usage(argv[0], messages);
    return 1;
  }

  return cmd_run(args, messages);
}

// seiri - multi-language dependency graph extractor
//
// Usage:
//   seiri <project-path> [-o output] [--format json|svg|facts] [--config seiri.yaml]
//         [-j N] [--analyze] [-v]
//
#include <fmt/format.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <utility>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "seiri/basic/diagnostic_printer.hpp"
#include "seiri/basic/parallel.hpp"
#include "seiri/driver/analyzer.hpp"
#include "seiri/export/graph_json.hpp"
#include "seiri/export/svg_exporter.hpp"
#include "seiri/project/project_config.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "seiri - multi-language dependency graph extractor\n\n"
            << "Usage: " << program_name << " <project-path> [options]\n\n"
            << "Options:\n"
            << "  -o, --output <path>        Write the result to a file (default: stdout)\n"
            << "  --format <json|svg|facts>  Output format (default: json)\n"
            << "  --config <seiri.yaml>      Configuration file (default: searched upward)\n"
            << "  -j, --jobs <N>             Worker threads (0 = all cores)\n"
            << "  --analyze                  Include SCC and betweenness analysis\n"
            << "  --report-unresolved        Note imports recorded as external modules\n"
            << "  --report-unsupported       Note files without a language adapter\n"
            << "  -v, --verbose              Verbose output\n"
            << "  -h, --help                 Show this help message\n\n"
            << "Exit status: 0 clean, 2 graph produced with warnings, 1 fatal error\n";
}

void print_diagnostics(const seiri::DiagnosticBag & diagnostics, bool verbose)
{
  seiri::DiagnosticBag shown;
  for (const auto & diag : diagnostics) {
    if (verbose || diag.severity != seiri::Severity::Info) {
      shown.add(diag);
    }
  }
  if (shown.empty()) {
    return;
  }

  // Detect if terminal supports colors (simple check for TTY)
  const bool use_color = isatty(fileno(stderr)) != 0;
  seiri::DiagnosticPrinter printer(std::cerr, use_color);
  printer.print_all(shown);
  printer.print_summary(shown);
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string input_path;
  std::string output_path;
  std::string format;
  std::string config_path;
  std::optional<unsigned> jobs;
  bool analyze = false;
  bool report_unresolved = false;
  bool report_unsupported = false;
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

  auto take_value = [&](int & i, const std::string & flag) -> std::optional<std::string> {
    if (i + 1 >= argc) {
      args.error = "missing value for " + flag;
      return std::nullopt;
    }
    return std::string(argv[++i]);
  };

  for (int i = 1; i < argc && args.error.empty(); ++i) {
    std::string arg = argv[i];

    if (arg == "-o" || arg == "--output") {
      if (auto v = take_value(i, arg)) {
        args.output_path = *v;
      }
    } else if (arg == "--format") {
      if (auto v = take_value(i, arg)) {
        args.format = *v;
      }
    } else if (arg == "--config") {
      if (auto v = take_value(i, arg)) {
        args.config_path = *v;
      }
    } else if (arg == "-j" || arg == "--jobs") {
      if (auto v = take_value(i, arg)) {
        try {
          const int n = std::stoi(*v);
          if (n < 0) {
            args.error = "--jobs must not be negative";
          } else {
            args.jobs = static_cast<unsigned>(n);
          }
        } catch (const std::exception &) {
          args.error = "invalid value for --jobs: '" + *v + "'";
        }
      }
    } else if (arg == "--analyze") {
      args.analyze = true;
    } else if (arg == "--report-unresolved") {
      args.report_unresolved = true;
    } else if (arg == "--report-unsupported") {
      args.report_unsupported = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = "unknown option '" + arg + "'";
    } else if (args.input_path.empty()) {
      args.input_path = arg;
    } else {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

// ============================================================================
// Output
// ============================================================================

bool write_text(const std::string & output_path, const std::string & text)
{
  if (output_path.empty()) {
    std::cout << text << "\n";
    return true;
  }
  std::ofstream out(output_path);
  if (!out.is_open()) {
    std::cerr << "error: failed to open output file: " << output_path << "\n";
    return false;
  }
  out << text << "\n";
  if (!out) {
    std::cerr << "error: failed to write output file: " << output_path << "\n";
    return false;
  }
  return true;
}

bool emit(
  const seiri::AnalyzeResult & result, seiri::OutputFormat format, const std::string & output_path)
{
  switch (format) {
    case seiri::OutputFormat::Json: {
      const auto j = seiri::graph_to_json(
        result.graph, &result.diagnostics, result.analysis ? &*result.analysis : nullptr);
      return write_text(output_path, j.dump(2));
    }
    case seiri::OutputFormat::Facts:
      return write_text(output_path, seiri::facts_to_json(result.index, result.files).dump(2));
    case seiri::OutputFormat::Svg: {
      if (output_path.empty()) {
        std::cerr << "error: --format svg requires -o <file>\n";
        return false;
      }
      const auto written = seiri::write_svg(result.graph, output_path);
      if (!written.success) {
        std::cerr << "error: " << written.error << "\n";
      }
      return written.success;
    }
  }
  return false;
}

void print_analysis(const seiri::AnalyzeResult & result)
{
  if (!result.analysis) {
    return;
  }
  const auto & a = *result.analysis;
  fmt::print(
    stderr, "Components: {} (largest: {} files), import cycles: {}\n", a.component_count(),
    a.largest_component.size(), a.cycles().size());

  std::optional<std::pair<seiri::NodeId, double>> top;
  for (const auto & [id, score] : a.betweenness) {
    if (!top || score > top->second) {
      top = std::make_pair(id, score);
    }
  }
  if (top && top->second > 0.0) {
    fmt::print(
      stderr, "Highest betweenness: {} ({:.4f})\n", result.graph.node(top->first).name(),
      top->second);
  }
}

// ============================================================================
// Command
// ============================================================================

int run(const CommandArgs & args)
{
  const fs::path input_path = fs::absolute(args.input_path);
  if (!fs::exists(input_path)) {
    std::cerr << "error: path not found: " << input_path.string() << "\n";
    return 1;
  }

  // Configuration: explicit file, else searched upward from the project path
  std::optional<seiri::ProjectConfig> config;
  std::optional<fs::path> config_path;
  if (!args.config_path.empty()) {
    config_path = fs::absolute(args.config_path);
  } else {
    config_path = seiri::find_project_config(input_path);
  }
  if (config_path) {
    const auto loaded = seiri::load_project_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << config_path->string() << ": " << loaded.error << "\n";
      return 1;
    }
    config = loaded.config;
    if (args.verbose) {
      fmt::print(stderr, "Using configuration: {}\n", config_path->string());
    }
  }

  seiri::AnalyzeOptions options;
  seiri::OutputFormat format = seiri::OutputFormat::Json;
  std::string output_path;
  if (config) {
    options = seiri::AnalyzeOptions::from_config(*config);
    format = config->output.format;
    if (!config->output.path.empty()) {
      output_path = (config->config_dir / config->output.path).string();
    }
  }

  // Command-line flags override the configuration
  if (!args.format.empty()) {
    const auto parsed = seiri::output_format_from_string(args.format);
    if (!parsed) {
      std::cerr << "error: unknown format '" << args.format << "' (json, svg or facts)\n";
      return 1;
    }
    format = *parsed;
  }
  if (!args.output_path.empty()) {
    output_path = args.output_path;
  }
  if (args.jobs) {
    options.jobs = *args.jobs;
  }
  options.analyze = options.analyze || args.analyze;
  options.report_unresolved = options.report_unresolved || args.report_unresolved;
  options.report_unsupported = options.report_unsupported || args.report_unsupported;

  if (format == seiri::OutputFormat::Svg && output_path.empty()) {
    std::cerr << "error: --format svg requires -o <file>\n";
    return 1;
  }

  if (args.verbose) {
    fmt::print(
      stderr, "Analyzing: {} ({} jobs)\n", input_path.string(), seiri::effective_jobs(options.jobs));
  }

  const auto result = seiri::Analyzer::analyze_directory(input_path, options);
  print_diagnostics(result.diagnostics, args.verbose);
  if (!result.success) {
    return 1;
  }

  if (args.verbose) {
    fmt::print(
      stderr, "Analyzed {} files ({} failed to parse): {} nodes, {} edges\n", result.index.size(),
      result.parse_failures(), result.graph.node_count(), result.graph.edge_count());
    print_analysis(result);
  }

  if (!emit(result, format, output_path)) {
    return 1;
  }
  if (args.verbose && !output_path.empty()) {
    fmt::print(stderr, "Wrote: {}\n", output_path);
  }

  return result.exit_status();
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return 1;
  }

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.input_path.empty()) {
    std::cerr << "error: project path required\n";
    print_usage(argv[0]);
    return 1;
  }

  return run(args);
}

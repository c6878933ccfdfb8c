// flowlint - Conversational flow graph linter
//
// Usage:
//   flowlint check [agent-dir] [--config <file>] [--format text|json] [-o <file>]
//   flowlint init <dir>
//
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "flow_lint/driver/linter.hpp"
#include "flow_lint/project/lint_config.hpp"
#include "flow_lint/report/finding_printer.hpp"
#include "flow_lint/report/json_report.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "flowlint v0.1.0\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  check [agent-dir]        Analyze an exported agent (default: .)\n"
            << "  init <dir>               Write a default flowlint.yaml into <dir>\n\n"
            << "Options:\n"
            << "  -c, --config <file>      Configuration file (default: nearest flowlint.yaml)\n"
            << "  -f, --format <fmt>       Report format: text or json\n"
            << "  -o, --output <file>      Write the report to a file instead of stdout\n"
            << "  --threshold <n>          Loop detection cost threshold\n"
            << "  --parallel               Run analysis passes concurrently\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_path;
  std::string config_path;
  std::string output_path;
  std::string format;
  std::string threshold;
  bool parallel = false;
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
    } else if (arg == "-c" || arg == "--config") {
      if (i + 1 < argc) {
        args.config_path = argv[++i];
      }
    } else if (arg == "-f" || arg == "--format") {
      if (i + 1 < argc) {
        args.format = argv[++i];
      }
    } else if (arg == "--threshold") {
      if (i + 1 < argc) {
        args.threshold = argv[++i];
      }
    } else if (arg == "--parallel") {
      args.parallel = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_path.empty()) {
      args.input_path = arg;
    }
  }

  return args;
}

/// Resolve the configuration: explicit file, nearest flowlint.yaml, or defaults.
flow_lint::ConfigLoadResult resolve_config(const CommandArgs & args, const fs::path & agent_root)
{
  if (!args.config_path.empty()) {
    return flow_lint::load_lint_config(args.config_path);
  }
  if (auto found = flow_lint::find_lint_config(agent_root)) {
    return flow_lint::load_lint_config(*found);
  }
  return flow_lint::ConfigLoadResult::ok(flow_lint::LintConfig{});
}

/// Apply command-line overrides on top of the configuration file.
bool apply_overrides(const CommandArgs & args, flow_lint::LintConfig & config)
{
  if (!args.format.empty()) {
    if (args.format == "text") {
      config.report.format = flow_lint::ReportFormat::Text;
    } else if (args.format == "json") {
      config.report.format = flow_lint::ReportFormat::Json;
    } else {
      std::cerr << "error: invalid format '" << args.format << "' (must be 'text' or 'json')\n";
      return false;
    }
  }

  if (!args.threshold.empty()) {
    int value = 0;
    try {
      size_t consumed = 0;
      value = std::stoi(args.threshold, &consumed);
      if (consumed != args.threshold.size()) {
        value = 0;
      }
    } catch (const std::logic_error &) {
      value = 0;
    }
    if (value <= 0) {
      std::cerr << "error: --threshold must be a positive integer, got '" << args.threshold
                << "'\n";
      return false;
    }
    config.analysis.loops.threshold = value;
  }

  if (args.parallel) {
    config.analysis.parallel = true;
  }
  return true;
}

void write_report(
  std::ostream & os, bool use_color, const flow_lint::FindingBag & findings,
  const flow_lint::LintConfig & config, const fs::path & root)
{
  if (config.report.format == flow_lint::ReportFormat::Json) {
    os << flow_lint::dump_report(findings, root) << "\n";
    return;
  }
  flow_lint::FindingPrinter printer(os, use_color);
  printer.print_all(findings);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_check(const CommandArgs & args)
{
  const fs::path agent_root =
    fs::absolute(args.input_path.empty() ? fs::current_path() : fs::path(args.input_path));

  auto config_result = resolve_config(args, agent_root);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return 1;
  }
  flow_lint::LintConfig config = std::move(config_result.config);
  if (!apply_overrides(args, config)) {
    return 1;
  }

  if (args.verbose) {
    if (!config.source_path.empty()) {
      std::cerr << "Using configuration: " << config.source_path.string() << "\n";
    }
    std::cerr << "Loading agent: " << agent_root.string() << "\n";
  }

  auto loaded = flow_lint::load_agent(agent_root);
  if (!loaded.success) {
    std::cerr << "error: " << loaded.error->to_string() << "\n";
    return 1;
  }

  if (args.verbose) {
    std::cerr << "Loaded " << loaded.graph.flows().size() << " flow(s), "
              << loaded.graph.page_count() << " page(s), " << loaded.graph.route_group_count()
              << " route group(s)\n";
    std::cerr << "Running checks...\n";
  }

  const flow_lint::FindingBag findings =
    flow_lint::Linter::lint_graph(loaded.graph, config.analysis);
  const flow_lint::FindingBag reported = findings.filtered(config.report.min_severity);

  if (args.output_path.empty()) {
    const bool use_color = isatty(fileno(stdout)) != 0;
    write_report(std::cout, use_color, reported, config, agent_root);
  } else {
    std::ofstream out(args.output_path);
    if (!out.is_open()) {
      std::cerr << "error: failed to open output file: " << args.output_path << "\n";
      return 1;
    }
    write_report(out, false, reported, config, agent_root);
    if (args.verbose) {
      std::cerr << "Report written to " << args.output_path << "\n";
    }
  }

  return findings.has_errors() ? 1 : 0;
}

int cmd_init(const CommandArgs & args)
{
  if (args.input_path.empty()) {
    std::cerr << "error: directory required\n";
    std::cerr << "usage: flowlint init <dir>\n";
    return 1;
  }

  const fs::path dir = fs::absolute(args.input_path);
  const fs::path config_file = dir / flow_lint::k_lint_config_file_name;

  if (fs::exists(config_file)) {
    std::cerr << "error: file already exists: " << config_file.string() << "\n";
    return 1;
  }

  try {
    fs::create_directories(dir);

    std::ofstream config(config_file);
    if (!config.is_open()) {
      std::cerr << "error: failed to open file: " << config_file.string() << "\n";
      return 1;
    }
    config << flow_lint::default_lint_config_text();
    config.close();

    std::cout << "Wrote " << config_file.string() << "\n";
    return 0;
  } catch (const std::exception & e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
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

  if (args.command == "init") {
    return cmd_init(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  print_usage(argv[0]);
  return 1;
}

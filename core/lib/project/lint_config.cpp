// flow_lint/project/lint_config.cpp - Lint configuration implementation
//
#include "flow_lint/project/lint_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <initializer_list>
#include <sstream>

namespace flow_lint
{

namespace
{

/// Read an optional boolean key into `out`
void read_bool(const YAML::Node & section, const char * key, bool & out)
{
  if (section[key]) {
    out = section[key].as<bool>();
  }
}

/// Read an optional positive integer key into `out`
bool read_positive(
  const YAML::Node & section, const char * key, int & out, std::string & error)
{
  if (!section[key]) {
    return true;
  }
  const int value = section[key].as<int>();
  if (value <= 0) {
    error = std::string("loop_detection.") + key + " must be a positive integer";
    return false;
  }
  out = value;
  return true;
}

bool require_map(const YAML::Node & root, const char * key, std::string & error)
{
  if (root[key] && !root[key].IsMap()) {
    error = std::string(key) + " must be a map";
    return false;
  }
  return true;
}

}  // namespace

ConfigLoadResult parse_lint_config(const std::string & yaml_text)
{
  LintConfig config;
  std::string error;

  try {
    const YAML::Node root = YAML::Load(yaml_text);
    if (root.IsNull()) {
      return ConfigLoadResult::ok(std::move(config));
    }
    if (!root.IsMap()) {
      return ConfigLoadResult::fail("configuration must be a map");
    }

    for (const char * section : {"checks", "loop_detection", "execution", "report"}) {
      if (!require_map(root, section, error)) {
        return ConfigLoadResult::fail(error);
      }
    }

    // Parse 'checks' section
    if (root["checks"]) {
      const auto & checks = root["checks"];
      CheckSelection & sel = config.analysis.checks;
      read_bool(checks, "unreachable_pages", sel.unreachable_pages);
      read_bool(checks, "missing_event_handlers", sel.missing_event_handlers);
      read_bool(checks, "stuck_pages", sel.stuck_pages);
      read_bool(checks, "unused_route_groups", sel.unused_route_groups);
      read_bool(checks, "loops", sel.loops);
    }

    // Parse 'loop_detection' section
    if (root["loop_detection"]) {
      const auto & loops = root["loop_detection"];
      LoopDetectorOptions & opt = config.analysis.loops;
      if (
        !read_positive(loops, "threshold", opt.threshold, error) ||
        !read_positive(loops, "page_cost", opt.page_cost, error) ||
        !read_positive(loops, "entry_action_cost", opt.entry_action_cost, error)) {
        return ConfigLoadResult::fail(error);
      }
    }

    // Parse 'execution' section
    if (root["execution"]) {
      read_bool(root["execution"], "parallel", config.analysis.parallel);
    }

    // Parse 'report' section
    if (root["report"]) {
      const auto & report = root["report"];

      if (report["format"]) {
        const auto format = report["format"].as<std::string>();
        if (format == "text") {
          config.report.format = ReportFormat::Text;
        } else if (format == "json") {
          config.report.format = ReportFormat::Json;
        } else {
          return ConfigLoadResult::fail(
            "invalid report.format: '" + format + "' (must be 'text' or 'json')");
        }
      }

      if (report["min_severity"]) {
        const auto text = report["min_severity"].as<std::string>();
        const auto severity = parse_severity(text);
        if (!severity) {
          return ConfigLoadResult::fail(
            "invalid report.min_severity: '" + text + "' (must be 'info', 'warning' or 'error')");
        }
        config.report.min_severity = *severity;
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

ConfigLoadResult load_lint_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream in(config_path);
  if (!in.is_open()) {
    return ConfigLoadResult::fail("cannot open configuration file: " + config_path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  ConfigLoadResult result = parse_lint_config(buffer.str());
  if (!result.success) {
    result.error = config_path.string() + ": " + result.error;
    return result;
  }
  result.config.source_path = fs::absolute(config_path);
  return result;
}

std::optional<std::filesystem::path> find_lint_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If startDir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_lint_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

std::string default_lint_config_text()
{
  return "checks:\n"
         "  unreachable_pages: true\n"
         "  missing_event_handlers: true\n"
         "  stuck_pages: true\n"
         "  unused_route_groups: true\n"
         "  loops: true\n\n"
         "loop_detection:\n"
         "  threshold: 25\n"
         "  page_cost: 1\n"
         "  entry_action_cost: 2\n\n"
         "execution:\n"
         "  parallel: false\n\n"
         "report:\n"
         "  format: text\n"
         "  min_severity: info\n";
}

}  // namespace flow_lint

// flow_lint/project/lint_config.hpp - Lint configuration (flowlint.yaml)
//
// Parses and validates flowlint.yaml configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>

#include "flow_lint/analysis/finding_aggregator.hpp"
#include "flow_lint/basic/finding.hpp"

namespace flow_lint
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class ReportFormat {
  Text,  ///< Colored terminal output
  Json,  ///< Machine-readable report
};

/**
 * Report section.
 */
struct ReportConfig
{
  ReportFormat format = ReportFormat::Text;

  /// Findings below this severity are not reported
  Severity min_severity = Severity::Info;
};

/**
 * Complete lint configuration (flowlint.yaml).
 */
struct LintConfig
{
  AnalysisOptions analysis;
  ReportConfig report;

  /// Configuration file this was loaded from (empty for defaults)
  std::filesystem::path source_path;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  LintConfig config;

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(LintConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a lint configuration from a flowlint.yaml file.
 *
 * Keys that are absent keep their defaults.
 *
 * @param config_path Path to flowlint.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_lint_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text (used by load_lint_config and by tests).
 */
[[nodiscard]] ConfigLoadResult parse_lint_config(const std::string & yaml_text);

/**
 * Find a configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to flowlint.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_lint_config(
  const std::filesystem::path & start_dir);

/**
 * Default configuration file contents written by `flowlint init`.
 */
[[nodiscard]] std::string default_lint_config_text();

/**
 * Default name of the configuration file.
 */
inline constexpr const char * k_lint_config_file_name = "flowlint.yaml";

}  // namespace flow_lint

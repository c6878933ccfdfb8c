// flow_lint/report/json_report.hpp - Findings as JSON
#pragma once

#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>

#include "flow_lint/basic/finding.hpp"

namespace flow_lint
{

/**
 * {"flow", "page", "category", "code", "severity", "message"[, "help"]}
 */
[[nodiscard]] nlohmann::json to_json(const Finding & finding);

/**
 * {"root": ..., "summary": {"errors", "warnings", "infos", "total"}, "findings": [...]}
 *
 * Findings keep their report order.
 */
[[nodiscard]] nlohmann::json to_json(
  const FindingBag & findings, const std::filesystem::path & root);

/**
 * Serialized report text. Bytes that are not valid UTF-8 (file-stem names
 * from a foreign filesystem encoding) are written as U+FFFD.
 */
[[nodiscard]] std::string dump_report(
  const FindingBag & findings, const std::filesystem::path & root, int indent = 2);

}  // namespace flow_lint

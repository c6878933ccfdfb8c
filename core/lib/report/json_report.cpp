// flow_lint/report/json_report.cpp
//
#include "flow_lint/report/json_report.hpp"

#include <string>

namespace flow_lint
{

using json = nlohmann::json;

json to_json(const Finding & finding)
{
  json out{
    {"flow", finding.flow},
    {"page", finding.page},
    {"category", std::string(to_string(finding.category))},
    {"code", finding.code},
    {"severity", std::string(to_string(finding.severity))},
    {"message", finding.message},
  };
  if (finding.help_message) {
    out["help"] = *finding.help_message;
  }
  return out;
}

json to_json(const FindingBag & findings, const std::filesystem::path & root)
{
  json out;
  out["root"] = root.string();
  out["summary"] = json{
    {"errors", findings.count(Severity::Error)},
    {"warnings", findings.count(Severity::Warning)},
    {"infos", findings.count(Severity::Info)},
    {"total", findings.size()},
  };
  out["findings"] = json::array();
  for (const auto & f : findings) {
    out["findings"].push_back(to_json(f));
  }
  return out;
}

std::string dump_report(
  const FindingBag & findings, const std::filesystem::path & root, int indent)
{
  return to_json(findings, root).dump(indent, ' ', false, json::error_handler_t::replace);
}

}  // namespace flow_lint

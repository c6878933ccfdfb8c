// flow_lint/basic/finding.cpp - Finding implementation
#include "flow_lint/basic/finding.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>
#include <utility>

namespace flow_lint
{

std::string_view to_string(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return "Error";
    case Severity::Warning:
      return "Warning";
    case Severity::Info:
      return "Info";
  }
  return "Unknown";
}

std::string_view to_string(FindingCategory category) noexcept
{
  switch (category) {
    case FindingCategory::UnreachablePage:
      return "Unreachable Page";
    case FindingCategory::MissingEventHandler:
      return "Missing Event Handler";
    case FindingCategory::StuckPage:
      return "Stuck Page";
    case FindingCategory::UnusedRouteGroup:
      return "Unused Route Group";
    case FindingCategory::InfiniteLoop:
      return "Infinite Loop";
    case FindingCategory::PossibleInfiniteLoop:
      return "Possible Infinite Loop";
  }
  return "Unknown";
}

std::string_view default_code(FindingCategory category) noexcept
{
  switch (category) {
    case FindingCategory::UnreachablePage:
      return "FL100";
    case FindingCategory::MissingEventHandler:
      return "FL200";
    case FindingCategory::StuckPage:
      return "FL300";
    case FindingCategory::UnusedRouteGroup:
      return "FL400";
    case FindingCategory::InfiniteLoop:
      return "FL500";
    case FindingCategory::PossibleInfiniteLoop:
      return "FL501";
  }
  return "FL000";
}

std::optional<Severity> parse_severity(std::string_view text) noexcept
{
  std::string lowered;
  lowered.reserve(text.size());
  for (const char c : text) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  if (lowered == "error") return Severity::Error;
  if (lowered == "warning") return Severity::Warning;
  if (lowered == "info") return Severity::Info;
  return std::nullopt;
}

// ============================================================================
// FindingBuilder
// ============================================================================

FindingBuilder::FindingBuilder(FindingBag & bag, Finding finding)
: bag_(bag), finding_(std::move(finding))
{
}

FindingBuilder::FindingBuilder(FindingBuilder && other) noexcept
: bag_(other.bag_), finding_(std::move(other.finding_)), active_(other.active_)
{
  other.active_ = false;
}

FindingBuilder::~FindingBuilder()
{
  if (active_) {
    bag_.add(std::move(finding_));
  }
}

FindingBuilder & FindingBuilder::with_code(std::string code)
{
  finding_.code = std::move(code);
  return *this;
}

FindingBuilder & FindingBuilder::with_help(std::string help_msg)
{
  finding_.help_message = std::move(help_msg);
  return *this;
}

// ============================================================================
// FindingBag
// ============================================================================

FindingBuilder FindingBag::make(
  Severity severity, FindingCategory category, std::string flow, std::string page,
  std::string message)
{
  Finding f;
  f.severity = severity;
  f.category = category;
  f.code = std::string(default_code(category));
  f.flow = std::move(flow);
  f.page = std::move(page);
  f.message = std::move(message);
  return {*this, std::move(f)};
}

FindingBuilder FindingBag::report_error(
  FindingCategory category, std::string flow, std::string page, std::string message)
{
  return make(Severity::Error, category, std::move(flow), std::move(page), std::move(message));
}

FindingBuilder FindingBag::report_warning(
  FindingCategory category, std::string flow, std::string page, std::string message)
{
  return make(
    Severity::Warning, category, std::move(flow), std::move(page), std::move(message));
}

FindingBuilder FindingBag::report_info(
  FindingCategory category, std::string flow, std::string page, std::string message)
{
  return make(Severity::Info, category, std::move(flow), std::move(page), std::move(message));
}

void FindingBag::add(Finding && finding) { findings_.push_back(std::move(finding)); }

void FindingBag::add(const Finding & finding) { findings_.push_back(finding); }

std::vector<Finding> FindingBag::errors() const
{
  std::vector<Finding> result;
  std::copy_if(
    findings_.begin(), findings_.end(), std::back_inserter(result),
    [](const Finding & f) { return f.severity == Severity::Error; });
  return result;
}

std::vector<Finding> FindingBag::warnings() const
{
  std::vector<Finding> result;
  std::copy_if(
    findings_.begin(), findings_.end(), std::back_inserter(result),
    [](const Finding & f) { return f.severity == Severity::Warning; });
  return result;
}

bool FindingBag::has_errors() const
{
  return std::any_of(findings_.begin(), findings_.end(), [](const Finding & f) {
    return f.severity == Severity::Error;
  });
}

bool FindingBag::has_warnings() const
{
  return std::any_of(findings_.begin(), findings_.end(), [](const Finding & f) {
    return f.severity == Severity::Warning;
  });
}

size_t FindingBag::count(Severity severity) const
{
  return static_cast<size_t>(std::count_if(
    findings_.begin(), findings_.end(),
    [severity](const Finding & f) { return f.severity == severity; }));
}

size_t FindingBag::count(FindingCategory category) const
{
  return static_cast<size_t>(std::count_if(
    findings_.begin(), findings_.end(),
    [category](const Finding & f) { return f.category == category; }));
}

FindingBag FindingBag::filtered(Severity threshold) const
{
  FindingBag out;
  for (const auto & f : findings_) {
    if (is_at_least(f.severity, threshold)) {
      out.add(f);
    }
  }
  return out;
}

void FindingBag::merge(FindingBag && other)
{
  findings_.insert(
    findings_.end(), std::make_move_iterator(other.findings_.begin()),
    std::make_move_iterator(other.findings_.end()));
  other.findings_.clear();
}

void FindingBag::merge(const FindingBag & other)
{
  findings_.insert(findings_.end(), other.findings_.begin(), other.findings_.end());
}

}  // namespace flow_lint

// flow_lint/analysis/route_group_usage_analyzer.cpp
//
#include "flow_lint/analysis/route_group_usage_analyzer.hpp"

#include <string>

#include "flow_lint/resolution/reference_resolver.hpp"

namespace flow_lint
{

namespace
{

void mark_used(
  const Flow & flow, const std::vector<std::string> & refs, std::vector<bool> & used)
{
  for (const auto & ref : refs) {
    const RouteGroup * group = ReferenceResolver::resolve_route_group(flow, ref);
    if (!group) {
      continue;
    }
    // Resolved groups always live in flow.route_groups.
    used[static_cast<size_t>(group - flow.route_groups.data())] = true;
  }
}

}  // namespace

std::vector<bool> RouteGroupUsageAnalyzer::used_route_groups(const Flow & flow)
{
  std::vector<bool> used(flow.route_groups.size(), false);
  mark_used(flow, flow.route_group_refs, used);
  for (const auto & page : flow.pages) {
    mark_used(flow, page.route_group_refs, used);
  }
  return used;
}

bool RouteGroupUsageAnalyzer::check(const Flow & flow)
{
  const size_t before = findingCount_;
  const std::vector<bool> used = used_route_groups(flow);

  for (size_t i = 0; i < flow.route_groups.size(); ++i) {
    if (used[i]) {
      continue;
    }
    ++findingCount_;
    if (findings_) {
      findings_->report_info(
        FindingCategory::UnusedRouteGroup, flow.display_name, k_no_page,
        "Unused Route Group: " + flow.route_groups[i].display_name);
    }
  }
  return findingCount_ == before;
}

bool RouteGroupUsageAnalyzer::check(const AgentGraph & graph)
{
  findingCount_ = 0;
  for (const auto & flow : graph.flows()) {
    check(flow);
  }
  return findingCount_ == 0;
}

}  // namespace flow_lint

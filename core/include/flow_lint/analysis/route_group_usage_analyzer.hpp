// flow_lint/analysis/route_group_usage_analyzer.hpp - Unused route groups
#pragma once

#include <cstddef>
#include <vector>

#include "flow_lint/basic/finding.hpp"
#include "flow_lint/model/agent_graph.hpp"

namespace flow_lint
{

/**
 * Reports route groups that neither the flow nor any of its pages reference.
 */
class RouteGroupUsageAnalyzer
{
public:
  explicit RouteGroupUsageAnalyzer(FindingBag * findings = nullptr) : findings_(findings) {}

  bool check(const AgentGraph & graph);
  bool check(const Flow & flow);

  /// Usage of each route group of `flow` (indexed like Flow::route_groups).
  [[nodiscard]] static std::vector<bool> used_route_groups(const Flow & flow);

  [[nodiscard]] bool has_findings() const noexcept { return findingCount_ > 0; }
  [[nodiscard]] size_t finding_count() const noexcept { return findingCount_; }

private:
  FindingBag * findings_ = nullptr;
  size_t findingCount_ = 0;
};

}  // namespace flow_lint

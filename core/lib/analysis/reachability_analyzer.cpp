// flow_lint/analysis/reachability_analyzer.cpp - BFS from Start
//
#include "flow_lint/analysis/reachability_analyzer.hpp"

#include <deque>

#include "flow_lint/analysis/flow_edges.hpp"

namespace flow_lint
{

std::vector<bool> ReachabilityAnalyzer::reachable_pages(const Flow & flow)
{
  std::vector<bool> visited(flow.pages.size(), false);

  std::deque<PageIndex> queue;
  queue.push_back(k_start_page);

  while (!queue.empty()) {
    const PageIndex current = queue.front();
    queue.pop_front();

    for (const auto & edge : collect_edges(flow, current)) {
      const auto target = resolve_edge_target(flow, edge);
      if (!target || *target == k_start_page) {
        continue;
      }
      if (!visited[*target]) {
        visited[*target] = true;
        queue.push_back(*target);
      }
    }
  }

  return visited;
}

bool ReachabilityAnalyzer::check(const Flow & flow)
{
  const size_t before = findingCount_;
  const std::vector<bool> visited = reachable_pages(flow);

  for (PageIndex i = 0; i < flow.pages.size(); ++i) {
    if (visited[i]) {
      continue;
    }
    ++findingCount_;
    if (findings_) {
      findings_
        ->report_warning(
          FindingCategory::UnreachablePage, flow.display_name, flow.pages[i].display_name,
          "Unreachable Page: no route from Start leads to this page")
        .with_help("add a transition to this page or delete it");
    }
  }
  return findingCount_ == before;
}

bool ReachabilityAnalyzer::check(const AgentGraph & graph)
{
  findingCount_ = 0;
  for (const auto & flow : graph.flows()) {
    check(flow);
  }
  return findingCount_ == 0;
}

}  // namespace flow_lint

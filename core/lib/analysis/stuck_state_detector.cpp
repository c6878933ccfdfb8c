// flow_lint/analysis/stuck_state_detector.cpp
//
#include "flow_lint/analysis/stuck_state_detector.hpp"

#include "flow_lint/analysis/flow_edges.hpp"

namespace flow_lint
{

bool StuckStateDetector::is_stuck(const Page & page) noexcept
{
  return !is_input_accepting(page) && !has_unconditional_exit(page);
}

bool StuckStateDetector::check(const Flow & flow)
{
  const size_t before = findingCount_;

  for (const auto & page : flow.pages) {
    if (!is_stuck(page)) {
      continue;
    }
    ++findingCount_;
    if (findings_) {
      findings_
        ->report_error(
          FindingCategory::StuckPage, flow.display_name, page.display_name,
          "Potential Stuck Page (No Input, No True Route)")
        .with_help("add a route with condition \"true\" and a target");
    }
  }
  return findingCount_ == before;
}

bool StuckStateDetector::check(const AgentGraph & graph)
{
  findingCount_ = 0;
  for (const auto & flow : graph.flows()) {
    check(flow);
  }
  return findingCount_ == 0;
}

}  // namespace flow_lint

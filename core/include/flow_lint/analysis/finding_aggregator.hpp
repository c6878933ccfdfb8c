// flow_lint/analysis/finding_aggregator.hpp - Run all passes, merge findings
#pragma once

#include "flow_lint/analysis/loop_detector.hpp"
#include "flow_lint/basic/finding.hpp"
#include "flow_lint/model/agent_graph.hpp"

namespace flow_lint
{

/**
 * Which passes run. Disabled passes contribute nothing.
 */
struct CheckSelection
{
  bool unreachable_pages = true;
  bool missing_event_handlers = true;
  bool stuck_pages = true;
  bool unused_route_groups = true;
  bool loops = true;
};

struct AnalysisOptions
{
  CheckSelection checks;
  LoopDetectorOptions loops;

  /// Run the passes (and the loop detector's flows) as concurrent tasks.
  bool parallel = false;
};

/**
 * Concatenates pass outputs in a fixed order:
 *
 * 1. ReachabilityAnalyzer
 * 2. HandlerCompletenessChecker
 * 3. StuckStateDetector
 * 4. RouteGroupUsageAnalyzer
 * 5. LoopDetector
 *
 * No deduplication happens across passes. The graph is only read, so the
 * passes may run concurrently; the result is identical either way.
 */
class FindingAggregator
{
public:
  [[nodiscard]] static FindingBag run(const AgentGraph & graph, const AnalysisOptions & options);
};

}  // namespace flow_lint

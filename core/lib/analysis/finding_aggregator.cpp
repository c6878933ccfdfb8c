// flow_lint/analysis/finding_aggregator.cpp
//
#include "flow_lint/analysis/finding_aggregator.hpp"

#include <functional>
#include <future>
#include <utility>
#include <vector>

#include "flow_lint/analysis/handler_completeness_checker.hpp"
#include "flow_lint/analysis/reachability_analyzer.hpp"
#include "flow_lint/analysis/route_group_usage_analyzer.hpp"
#include "flow_lint/analysis/stuck_state_detector.hpp"

namespace flow_lint
{

namespace
{

using Pass = std::function<FindingBag()>;

std::vector<Pass> selected_passes(const AgentGraph & graph, const AnalysisOptions & options)
{
  std::vector<Pass> passes;
  const CheckSelection & c = options.checks;

  if (c.unreachable_pages) {
    passes.emplace_back([&graph]() {
      FindingBag bag;
      ReachabilityAnalyzer(&bag).check(graph);
      return bag;
    });
  }
  if (c.missing_event_handlers) {
    passes.emplace_back([&graph]() {
      FindingBag bag;
      HandlerCompletenessChecker(&bag).check(graph);
      return bag;
    });
  }
  if (c.stuck_pages) {
    passes.emplace_back([&graph]() {
      FindingBag bag;
      StuckStateDetector(&bag).check(graph);
      return bag;
    });
  }
  if (c.unused_route_groups) {
    passes.emplace_back([&graph]() {
      FindingBag bag;
      RouteGroupUsageAnalyzer(&bag).check(graph);
      return bag;
    });
  }
  if (c.loops) {
    LoopDetectorOptions loop_options = options.loops;
    loop_options.parallel = loop_options.parallel || options.parallel;
    passes.emplace_back([&graph, loop_options]() {
      FindingBag bag;
      LoopDetector(&bag, loop_options).check(graph);
      return bag;
    });
  }
  return passes;
}

}  // namespace

FindingBag FindingAggregator::run(const AgentGraph & graph, const AnalysisOptions & options)
{
  const std::vector<Pass> passes = selected_passes(graph, options);
  FindingBag report;

  if (!options.parallel) {
    for (const auto & pass : passes) {
      report.merge(pass());
    }
    return report;
  }

  std::vector<std::future<FindingBag>> pending;
  pending.reserve(passes.size());
  for (const auto & pass : passes) {
    pending.push_back(std::async(std::launch::async, pass));
  }
  for (auto & task : pending) {
    report.merge(task.get());
  }
  return report;
}

}  // namespace flow_lint

// flow_lint/analysis/loop_detector.hpp - Runaway conversational loop detection
//
// From Start and from every page that waits for the user, walk the graph
// depth-first along paths that never hand control back to the user. A path
// that revisits a page is a loop; a path whose weighted length reaches the
// threshold is a possible loop.
//
#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>

#include "flow_lint/basic/finding.hpp"
#include "flow_lint/model/agent_graph.hpp"

namespace flow_lint
{

struct LoopDetectorOptions
{
  /// Weighted path length at which a path is reported as a possible loop.
  int threshold = 25;

  /// Cost of entering a page without an entry action.
  int page_cost = 1;

  /// Cost of entering a page that declares an entry action.
  int entry_action_cost = 2;

  /// Analyze flows concurrently. Output order does not change.
  bool parallel = false;
};

inline constexpr const char * k_infinite_loop_prefix = "Infinite Loop Detected: ";
inline constexpr const char * k_possible_loop_prefix = "Possible Infinite Loop";

class LoopDetector
{
public:
  explicit LoopDetector(FindingBag * findings = nullptr, LoopDetectorOptions options = {})
  : findings_(findings), options_(options)
  {
  }

  bool check(const AgentGraph & graph);
  bool check(const Flow & flow);

  /**
   * Analyze one flow into a fresh bag.
   *
   * Messages are deduplicated within the flow, across all seeds. Flows share
   * no state, so this may run concurrently for different flows.
   */
  [[nodiscard]] FindingBag detect(const Flow & flow) const;

  [[nodiscard]] const LoopDetectorOptions & options() const noexcept { return options_; }

  [[nodiscard]] bool has_findings() const noexcept { return findingCount_ > 0; }
  [[nodiscard]] size_t finding_count() const noexcept { return findingCount_; }

private:
  void detect_from_seed(
    const Flow & flow, PageIndex seed, std::unordered_set<std::string> & seen,
    FindingBag & out) const;

  [[nodiscard]] int edge_cost(const Flow & flow, PageIndex target) const noexcept;

  FindingBag * findings_ = nullptr;
  LoopDetectorOptions options_;
  size_t findingCount_ = 0;
};

}  // namespace flow_lint

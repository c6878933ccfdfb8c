// flow_lint/analysis/stuck_state_detector.hpp - Dead-end page detection
//
// A page that does not wait for the user must leave through an unconditional
// ("true") route. Pages that cannot are reported as errors.
//
#pragma once

#include <cstddef>

#include "flow_lint/basic/finding.hpp"
#include "flow_lint/model/agent_graph.hpp"

namespace flow_lint
{

class StuckStateDetector
{
public:
  explicit StuckStateDetector(FindingBag * findings = nullptr) : findings_(findings) {}

  bool check(const AgentGraph & graph);
  bool check(const Flow & flow);

  [[nodiscard]] static bool is_stuck(const Page & page) noexcept;

  [[nodiscard]] bool has_findings() const noexcept { return findingCount_ > 0; }
  [[nodiscard]] size_t finding_count() const noexcept { return findingCount_; }

private:
  FindingBag * findings_ = nullptr;
  size_t findingCount_ = 0;
};

}  // namespace flow_lint

// flow_lint/analysis/handler_completeness_checker.hpp - Missing fallback handlers
//
// A page that waits for the user needs a "no-input" and a "no-match" handler,
// either on the page itself or on one of its form parameters' reprompts.
//
#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include "flow_lint/basic/finding.hpp"
#include "flow_lint/model/agent_graph.hpp"

namespace flow_lint
{

inline constexpr const char * k_no_input_event = "no-input";
inline constexpr const char * k_no_match_event = "no-match";

class HandlerCompletenessChecker
{
public:
  explicit HandlerCompletenessChecker(FindingBag * findings = nullptr) : findings_(findings) {}

  bool check(const AgentGraph & graph);
  bool check(const Flow & flow);

  /// Event names handled by the page and its form parameters' reprompts.
  [[nodiscard]] static std::vector<std::string> handled_events(const Page & page);

  [[nodiscard]] bool has_findings() const noexcept { return findingCount_ > 0; }
  [[nodiscard]] size_t finding_count() const noexcept { return findingCount_; }

private:
  void report_missing(const Flow & flow, const Page & page, const char * event);

  FindingBag * findings_ = nullptr;
  size_t findingCount_ = 0;
};

}  // namespace flow_lint

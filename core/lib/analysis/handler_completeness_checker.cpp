// flow_lint/analysis/handler_completeness_checker.cpp
//
#include "flow_lint/analysis/handler_completeness_checker.hpp"

#include <algorithm>

#include "flow_lint/analysis/flow_edges.hpp"

namespace flow_lint
{

namespace
{

bool any_contains(const std::vector<std::string> & events, std::string_view needle)
{
  return std::any_of(events.begin(), events.end(), [needle](const std::string & e) {
    return e.find(needle) != std::string::npos;
  });
}

}  // namespace

std::vector<std::string> HandlerCompletenessChecker::handled_events(const Page & page)
{
  std::vector<std::string> events;
  for (const auto & h : page.event_handlers) {
    events.push_back(h.event);
  }
  for (const auto & param : page.form_parameters) {
    for (const auto & h : param.reprompt_event_handlers) {
      events.push_back(h.event);
    }
  }
  return events;
}

void HandlerCompletenessChecker::report_missing(
  const Flow & flow, const Page & page, const char * event)
{
  ++findingCount_;
  if (!findings_) {
    return;
  }
  findings_
    ->report_warning(
      FindingCategory::MissingEventHandler, flow.display_name, page.display_name,
      std::string("Missing Event Handler: ") + event)
    .with_help(std::string("add a '") + event + "' event handler to the page or its form");
}

bool HandlerCompletenessChecker::check(const Flow & flow)
{
  const size_t before = findingCount_;

  for (const auto & page : flow.pages) {
    if (!is_input_accepting(page)) {
      continue;
    }
    const auto events = handled_events(page);
    if (!any_contains(events, k_no_input_event)) {
      report_missing(flow, page, k_no_input_event);
    }
    if (!any_contains(events, k_no_match_event)) {
      report_missing(flow, page, k_no_match_event);
    }
  }
  return findingCount_ == before;
}

bool HandlerCompletenessChecker::check(const AgentGraph & graph)
{
  findingCount_ = 0;
  for (const auto & flow : graph.flows()) {
    check(flow);
  }
  return findingCount_ == 0;
}

}  // namespace flow_lint

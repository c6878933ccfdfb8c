// flow_lint/analysis/flow_edges.cpp - Edge collection and page classification
//
#include "flow_lint/analysis/flow_edges.hpp"

#include <algorithm>
#include <cctype>

#include "flow_lint/resolution/reference_resolver.hpp"

namespace flow_lint
{

namespace
{

std::string_view view_of(const std::optional<std::string> & s) noexcept
{
  return s ? std::string_view(*s) : std::string_view{};
}

void append_routes(const std::vector<TransitionRoute> & routes, std::vector<Edge> & out)
{
  for (const auto & r : routes) {
    out.push_back(Edge{view_of(r.target_page), view_of(r.target_flow)});
  }
}

void append_handlers(const std::vector<EventHandler> & handlers, std::vector<Edge> & out)
{
  for (const auto & h : handlers) {
    out.push_back(Edge{view_of(h.target_page), view_of(h.target_flow)});
  }
}

void append_route_groups(
  const Flow & flow, const std::vector<std::string> & refs, std::vector<Edge> & out)
{
  for (const auto & ref : refs) {
    if (const RouteGroup * group = ReferenceResolver::resolve_route_group(flow, ref)) {
      append_routes(group->transition_routes, out);
    }
  }
}

bool any_intent(const std::vector<TransitionRoute> & routes) noexcept
{
  return std::any_of(
    routes.begin(), routes.end(), [](const TransitionRoute & r) { return r.intent.has_value(); });
}

}  // namespace

std::vector<Edge> collect_edges(const Flow & flow, PageIndex page, EdgeOptions options)
{
  std::vector<Edge> edges;

  if (page == k_start_page) {
    append_routes(flow.transition_routes, edges);
    append_route_groups(flow, flow.route_group_refs, edges);
    append_handlers(flow.event_handlers, edges);
    return edges;
  }

  if (page >= flow.pages.size()) {
    return edges;
  }

  const Page & p = flow.pages[page];
  append_routes(p.transition_routes, edges);
  append_route_groups(flow, p.route_group_refs, edges);
  append_handlers(p.event_handlers, edges);

  if (options.include_form_reprompts) {
    for (const auto & param : p.form_parameters) {
      append_handlers(param.reprompt_event_handlers, edges);
    }
  }
  return edges;
}

bool refers_to_flow(const Flow & flow, std::string_view ref) noexcept
{
  return ref == flow.id || ref == flow.display_name ||
         last_path_segment(ref) == last_path_segment(flow.id);
}

std::optional<PageIndex> resolve_edge_target(const Flow & flow, const Edge & edge)
{
  if (!edge.target_flow.empty()) {
    if (!refers_to_flow(flow, edge.target_flow)) {
      return std::nullopt;
    }
    if (edge.target_page.empty()) {
      return k_start_page;
    }
  }
  if (edge.target_page.empty()) {
    return std::nullopt;
  }
  return ReferenceResolver::resolve_page(flow, edge.target_page);
}

bool is_input_accepting(const Page & page) noexcept
{
  return page.has_form() || any_intent(page.transition_routes);
}

bool is_input_accepting(const Flow & flow, PageIndex page) noexcept
{
  if (page == k_start_page) {
    return any_intent(flow.transition_routes);
  }
  if (page >= flow.pages.size()) {
    return false;
  }
  return is_input_accepting(flow.pages[page]);
}

bool has_entry_action(const Flow & flow, PageIndex page) noexcept
{
  if (page == k_start_page || page >= flow.pages.size()) {
    return false;
  }
  return flow.pages[page].has_entry_action;
}

bool is_unconditional(const TransitionRoute & route) noexcept
{
  if (!route.condition) {
    return false;
  }
  const std::string & c = *route.condition;
  constexpr std::string_view k_true = "true";
  if (c.size() != k_true.size()) {
    return false;
  }
  for (size_t i = 0; i < c.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(c[i])) != k_true[i]) {
      return false;
    }
  }
  return true;
}

bool has_unconditional_exit(const Page & page) noexcept
{
  return std::any_of(
    page.transition_routes.begin(), page.transition_routes.end(),
    [](const TransitionRoute & r) {
      return is_unconditional(r) && (r.target_page.has_value() || r.target_flow.has_value());
    });
}

}  // namespace flow_lint

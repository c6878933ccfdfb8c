// flow_lint/analysis/flow_edges.hpp - Outgoing edges and page classification
//
// Shared by every analysis pass so they agree on what an edge is and on which
// pages hand control back to the user.
//
#pragma once

#include <optional>
#include <string_view>
#include <vector>

#include "flow_lint/model/agent_graph.hpp"

namespace flow_lint
{

/**
 * One outgoing transition of a page address. Views point into the graph.
 */
struct Edge
{
  std::string_view target_page;
  std::string_view target_flow;
};

struct EdgeOptions
{
  /// Also follow form parameters' reprompt event handlers.
  bool include_form_reprompts = false;
};

/**
 * Collect the outgoing edges of `page` in `flow`.
 *
 * Order: own transition routes, routes of referenced route groups (in
 * reference order), event handlers, then (optionally) form reprompt handlers.
 * For k_start_page the routes, groups and handlers come from the flow itself.
 */
[[nodiscard]] std::vector<Edge> collect_edges(
  const Flow & flow, PageIndex page, EdgeOptions options = {});

/**
 * Resolve the same-flow page an edge leads to.
 *
 * Returns std::nullopt for edges into another flow, for edges without a page
 * target and for references that do not resolve. An edge naming the current
 * flow without a page lands on k_start_page.
 */
[[nodiscard]] std::optional<PageIndex> resolve_edge_target(const Flow & flow, const Edge & edge);

/// True if `ref` names `flow` by id, display name or final path segment.
[[nodiscard]] bool refers_to_flow(const Flow & flow, std::string_view ref) noexcept;

/**
 * A page waits for the user if any own route names an intent or it declares a
 * form parameter.
 */
[[nodiscard]] bool is_input_accepting(const Page & page) noexcept;

/// Same predicate on an address; Start uses the flow's own routes.
[[nodiscard]] bool is_input_accepting(const Flow & flow, PageIndex page) noexcept;

/// Start never carries an entry action.
[[nodiscard]] bool has_entry_action(const Flow & flow, PageIndex page) noexcept;

/// condition == "true", compared case-insensitively.
[[nodiscard]] bool is_unconditional(const TransitionRoute & route) noexcept;

/// Some own route is unconditional and leads somewhere (page or flow).
[[nodiscard]] bool has_unconditional_exit(const Page & page) noexcept;

}  // namespace flow_lint

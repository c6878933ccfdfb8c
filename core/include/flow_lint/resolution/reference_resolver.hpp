// flow_lint/resolution/reference_resolver.hpp - Page / route group reference lookup
//
// References to pages show up in several forms across an export: the bare
// page id, the full resource path, or the page's display name. All of them
// must land on the same Page.
//
#pragma once

#include <optional>
#include <string_view>

#include "flow_lint/model/agent_graph.hpp"

namespace flow_lint
{

/**
 * Resolves references against the lookup tables built at load time.
 *
 * Page resolution order (first match wins):
 *   1. exact identifier
 *   2. exact display name / canonical name
 *   3. final path segment of the reference against identifier segments,
 *      then against display names
 *   4. "Start" / "START_PAGE" (bare or as final segment) -> k_start_page
 *
 * Route group resolution only tests identifier and name equality.
 *
 * Unresolved references yield std::nullopt / nullptr; callers drop the edge.
 */
class ReferenceResolver
{
public:
  explicit ReferenceResolver(const AgentGraph & graph) : graph_(graph) {}

  [[nodiscard]] std::optional<PageIndex> resolve_page(
    std::string_view flow_id, std::string_view ref) const;
  [[nodiscard]] const RouteGroup * resolve_route_group(
    std::string_view flow_id, std::string_view ref) const;

  [[nodiscard]] static std::optional<PageIndex> resolve_page(
    const Flow & flow, std::string_view ref);
  [[nodiscard]] static const RouteGroup * resolve_route_group(
    const Flow & flow, std::string_view ref);

  [[nodiscard]] const AgentGraph & graph() const noexcept { return graph_; }

private:
  const AgentGraph & graph_;
};

}  // namespace flow_lint

// flow_lint/resolution/reference_resolver.cpp - Reference lookup implementation
//
#include "flow_lint/resolution/reference_resolver.hpp"

#include <string>
#include <unordered_map>

namespace flow_lint
{

namespace
{

template <typename Map>
auto lookup(const Map & map, std::string_view key) -> std::optional<typename Map::mapped_type>
{
  auto it = map.find(std::string(key));
  if (it == map.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool names_start_page(std::string_view ref) noexcept
{
  return ref == k_start_page_name || ref == "START_PAGE";
}

}  // namespace

std::optional<PageIndex> ReferenceResolver::resolve_page(const Flow & flow, std::string_view ref)
{
  if (ref.empty()) {
    return std::nullopt;
  }

  const FlowIndex & idx = flow.index;

  if (auto hit = lookup(idx.page_by_id, ref)) return hit;
  if (auto hit = lookup(idx.page_by_name, ref)) return hit;

  const std::string_view seg = last_path_segment(ref);
  if (!seg.empty()) {
    if (auto hit = lookup(idx.page_by_segment, seg)) return hit;
    if (auto hit = lookup(idx.page_by_name, seg)) return hit;
  }

  if (names_start_page(ref) || names_start_page(seg)) {
    return k_start_page;
  }
  return std::nullopt;
}

const RouteGroup * ReferenceResolver::resolve_route_group(const Flow & flow, std::string_view ref)
{
  if (ref.empty()) {
    return nullptr;
  }

  const FlowIndex & idx = flow.index;
  if (auto hit = lookup(idx.route_group_by_id, ref)) {
    return &flow.route_groups[*hit];
  }
  if (auto hit = lookup(idx.route_group_by_name, ref)) {
    return &flow.route_groups[*hit];
  }
  return nullptr;
}

std::optional<PageIndex> ReferenceResolver::resolve_page(
  std::string_view flow_id, std::string_view ref) const
{
  const Flow * flow = graph_.find_flow(flow_id);
  if (!flow) {
    return std::nullopt;
  }
  return resolve_page(*flow, ref);
}

const RouteGroup * ReferenceResolver::resolve_route_group(
  std::string_view flow_id, std::string_view ref) const
{
  const Flow * flow = graph_.find_flow(flow_id);
  if (!flow) {
    return nullptr;
  }
  return resolve_route_group(*flow, ref);
}

}  // namespace flow_lint

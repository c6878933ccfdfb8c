// flow_lint/model/agent_graph.cpp - Agent model implementation
//
#include "flow_lint/model/agent_graph.hpp"

#include <numeric>
#include <utility>

namespace flow_lint
{

std::string_view last_path_segment(std::string_view ref) noexcept
{
  // Trailing separators carry no name.
  while (!ref.empty() && ref.back() == '/') {
    ref.remove_suffix(1);
  }
  const auto pos = ref.rfind('/');
  if (pos == std::string_view::npos) {
    return ref;
  }
  return ref.substr(pos + 1);
}

// ============================================================================
// Flow
// ============================================================================

std::string_view Flow::page_name(PageIndex page) const noexcept
{
  if (page == k_start_page || page >= pages.size()) {
    return k_start_page_name;
  }
  return pages[page].display_name;
}

void Flow::rebuild_index()
{
  index = FlowIndex{};

  for (PageIndex i = 0; i < pages.size(); ++i) {
    const Page & p = pages[i];
    index.page_by_id.emplace(p.id, i);
    index.page_by_name.emplace(p.display_name, i);
    index.page_by_segment.emplace(std::string(last_path_segment(p.id)), i);
  }

  for (std::size_t i = 0; i < route_groups.size(); ++i) {
    const RouteGroup & g = route_groups[i];
    index.route_group_by_id.emplace(g.id, i);
    index.route_group_by_name.emplace(g.display_name, i);
  }
}

// ============================================================================
// AgentGraph
// ============================================================================

const Flow * AgentGraph::find_flow(std::string_view ref) const
{
  const std::string key(ref);
  if (auto it = flow_by_id_.find(key); it != flow_by_id_.end()) {
    return &flows_[it->second];
  }
  if (auto it = flow_by_name_.find(key); it != flow_by_name_.end()) {
    return &flows_[it->second];
  }
  const std::string_view seg = last_path_segment(ref);
  for (const auto & flow : flows_) {
    if (last_path_segment(flow.id) == seg) {
      return &flow;
    }
  }
  return nullptr;
}

std::size_t AgentGraph::page_count() const noexcept
{
  return std::accumulate(
    flows_.begin(), flows_.end(), std::size_t{0},
    [](std::size_t n, const Flow & f) { return n + f.pages.size(); });
}

std::size_t AgentGraph::route_group_count() const noexcept
{
  return std::accumulate(
    flows_.begin(), flows_.end(), std::size_t{0},
    [](std::size_t n, const Flow & f) { return n + f.route_groups.size(); });
}

Flow & AgentGraph::add_flow(Flow flow)
{
  const std::size_t idx = flows_.size();
  flow.rebuild_index();
  flow_by_id_.emplace(flow.id, idx);
  flow_by_name_.emplace(flow.display_name, idx);
  flows_.push_back(std::move(flow));
  return flows_.back();
}

}  // namespace flow_lint

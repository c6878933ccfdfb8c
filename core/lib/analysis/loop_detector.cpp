// flow_lint/analysis/loop_detector.cpp - Weighted DFS loop detection
//
#include "flow_lint/analysis/loop_detector.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <algorithm>
#include <future>
#include <limits>
#include <gsl/span>
#include <string_view>
#include <utility>
#include <vector>

#include "flow_lint/analysis/flow_edges.hpp"

namespace flow_lint
{

namespace
{

struct Frame
{
  PageIndex page = k_start_page;
  std::vector<Edge> edges;
  size_t next = 0;
  int cost = 0;
};

std::string join_path(gsl::span<const std::string> names, std::string_view last)
{
  return fmt::format("{} -> {}", fmt::join(names.begin(), names.end(), " -> "), last);
}

/// The cycle rotated to start at its member earliest in load order, closed
/// with that member. Every entry point into one cycle yields the same text.
std::string cycle_message(const Flow & flow, gsl::span<const Frame> members)
{
  const auto lowest = std::min_element(
    members.begin(), members.end(),
    [](const Frame & a, const Frame & b) { return a.page < b.page; });
  const auto start = static_cast<size_t>(lowest - members.begin());

  std::vector<std::string> names;
  names.reserve(members.size());
  for (size_t i = 0; i < members.size(); ++i) {
    names.emplace_back(flow.page_name(members[(start + i) % members.size()].page));
  }
  const gsl::span<const std::string> body(names.data(), names.size());
  return join_path(body, names.front());
}

int saturating_add(int a, int b) noexcept
{
  return b > 0 && a > std::numeric_limits<int>::max() - b ? std::numeric_limits<int>::max() : a + b;
}

}  // namespace

int LoopDetector::edge_cost(const Flow & flow, PageIndex target) const noexcept
{
  return has_entry_action(flow, target) ? options_.entry_action_cost : options_.page_cost;
}

void LoopDetector::detect_from_seed(
  const Flow & flow, PageIndex seed, std::unordered_set<std::string> & seen,
  FindingBag & out) const
{
  constexpr EdgeOptions k_edges{true};
  const std::string seed_name(flow.page_name(seed));

  auto report = [&](FindingCategory category, std::string message) {
    if (!seen.insert(message).second) {
      return;
    }
    out.report_warning(category, flow.display_name, seed_name, std::move(message));
  };

  std::vector<Frame> stack;
  std::vector<std::string> path;
  stack.push_back(Frame{seed, collect_edges(flow, seed, k_edges), 0, 0});
  path.push_back(seed_name);

  while (!stack.empty()) {
    Frame & top = stack.back();
    if (top.next >= top.edges.size()) {
      stack.pop_back();
      path.pop_back();
      continue;
    }

    const Edge edge = top.edges[top.next++];
    const auto target = resolve_edge_target(flow, edge);
    if (!target) {
      continue;
    }

    const std::string_view name = flow.page_name(*target);
    const int cost = saturating_add(top.cost, edge_cost(flow, *target));

    const auto first = std::find(path.begin(), path.end(), name);
    if (first != path.end()) {
      const auto offset = static_cast<size_t>(first - path.begin());
      const gsl::span<const Frame> members(stack.data() + offset, stack.size() - offset);
      report(
        FindingCategory::InfiniteLoop, k_infinite_loop_prefix + cycle_message(flow, members));
      continue;
    }

    if (cost >= options_.threshold) {
      const gsl::span<const std::string> whole(path.data(), path.size());
      report(
        FindingCategory::PossibleInfiniteLoop,
        fmt::format("{} (Depth {}): {}", k_possible_loop_prefix, cost, join_path(whole, name)));
      continue;
    }

    // Control returns to the user here.
    if (is_input_accepting(flow, *target)) {
      continue;
    }

    const PageIndex next_page = *target;
    stack.push_back(Frame{next_page, collect_edges(flow, next_page, k_edges), 0, cost});
    path.emplace_back(name);
  }
}

FindingBag LoopDetector::detect(const Flow & flow) const
{
  FindingBag out;
  std::unordered_set<std::string> seen;

  detect_from_seed(flow, k_start_page, seen, out);
  for (PageIndex i = 0; i < flow.pages.size(); ++i) {
    if (is_input_accepting(flow.pages[i])) {
      detect_from_seed(flow, i, seen, out);
    }
  }
  return out;
}

bool LoopDetector::check(const Flow & flow)
{
  FindingBag found = detect(flow);
  const bool clean = found.empty();
  findingCount_ += found.size();
  if (findings_) {
    findings_->merge(std::move(found));
  }
  return clean;
}

bool LoopDetector::check(const AgentGraph & graph)
{
  findingCount_ = 0;

  if (!options_.parallel) {
    for (const auto & flow : graph.flows()) {
      check(flow);
    }
    return findingCount_ == 0;
  }

  std::vector<std::future<FindingBag>> pending;
  pending.reserve(graph.flows().size());
  for (const auto & flow : graph.flows()) {
    pending.push_back(
      std::async(std::launch::async, [this, &flow]() { return detect(flow); }));
  }

  // Join in flow order so the report matches a sequential run.
  for (auto & task : pending) {
    FindingBag found = task.get();
    findingCount_ += found.size();
    if (findings_) {
      findings_->merge(std::move(found));
    }
  }
  return findingCount_ == 0;
}

}  // namespace flow_lint

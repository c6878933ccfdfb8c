// flow_lint/driver/linter.cpp - Lint pipeline driver implementation
//
#include "flow_lint/driver/linter.hpp"

#include <utility>

namespace flow_lint
{

LintResult Linter::lint_agent(const std::filesystem::path & root, const AnalysisOptions & options)
{
  LintResult result;

  AgentLoadResult loaded = load_agent(root);
  if (!loaded.success) {
    result.load_error = std::move(loaded.error);
    return result;
  }

  result.graph = std::make_unique<AgentGraph>(std::move(loaded.graph));
  result.findings = lint_graph(*result.graph, options);
  result.success = true;
  return result;
}

FindingBag Linter::lint_graph(const AgentGraph & graph, const AnalysisOptions & options)
{
  return FindingAggregator::run(graph, options);
}

}  // namespace flow_lint

// seiri/analysis/graph_analysis.hpp - Structure metrics of the file import graph
#pragma once

#include <map>
#include <vector>

#include "seiri/graph/graph.hpp"

namespace seiri
{

/**
 * Metrics over FileNodes and the `imports` edges between them.
 * External modules and definitions are ignored.
 */
struct GraphAnalysis
{
  /// FileNodes considered, ascending id
  std::vector<NodeId> files;

  /// Strongly connected components; members ascending, components ordered
  /// by their smallest member
  std::vector<std::vector<NodeId>> components;

  /// FileNode -> index into `components`
  std::map<NodeId, size_t> component_of;

  /// Members of the largest component (the first one on ties)
  std::vector<NodeId> largest_component;

  /// Brandes betweenness, normalized by 1/((n-1)(n-2)) when n > 2
  std::map<NodeId, double> betweenness;

  [[nodiscard]] size_t component_count() const noexcept { return components.size(); }

  /// Components with more than one file (import cycles)
  [[nodiscard]] std::vector<std::vector<NodeId>> cycles() const;
};

[[nodiscard]] GraphAnalysis analyze_graph(const Graph & graph);

}  // namespace seiri

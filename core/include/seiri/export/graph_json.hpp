// seiri/export/graph_json.hpp - JSON form of graphs, facts and diagnostics
//
// The field names are the stable interchange schema shared by every
// consumer (JSON export, SVG renderer, external viewers).
//
#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

#include "seiri/analysis/graph_analysis.hpp"
#include "seiri/basic/diagnostic.hpp"
#include "seiri/graph/graph.hpp"
#include "seiri/graph/graph_assembler.hpp"
#include "seiri/resolve/file_index.hpp"

namespace seiri
{

/// Schema version written to the `version` field
inline constexpr int k_graph_schema_version = 1;

/**
 * Serialize a graph.
 *
 * @param diags Diagnostics to embed (optional)
 * @param analysis Analysis summary to embed under `analysis` (optional)
 */
[[nodiscard]] nlohmann::json graph_to_json(
  const Graph & graph, const DiagnosticBag * diags = nullptr,
  const GraphAnalysis * analysis = nullptr);

struct GraphReadResult
{
  Graph graph;
  bool success = false;
  std::string error;

  static GraphReadResult ok(Graph g)
  {
    GraphReadResult r;
    r.graph = std::move(g);
    r.success = true;
    return r;
  }

  static GraphReadResult fail(std::string msg)
  {
    GraphReadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

/// Rebuild a graph from graph_to_json() output
[[nodiscard]] GraphReadResult graph_from_json(const nlohmann::json & j);

/// One normalized fact; `file` is the project-relative path
[[nodiscard]] nlohmann::json fact_to_json(const Fact & fact, std::string_view file);

/// Every file's facts, in discovery order
[[nodiscard]] nlohmann::json facts_to_json(
  const FileIndex & index, const std::vector<FileFacts> & files);

[[nodiscard]] nlohmann::json diagnostics_to_json(const DiagnosticBag & diags);

[[nodiscard]] nlohmann::json analysis_to_json(const GraphAnalysis & analysis);

}  // namespace seiri

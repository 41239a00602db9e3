// seiri/export/svg_exporter.hpp - Static SVG rendering of the file import graph
//
// FileNodes are laid out on a circle (1200x900 canvas), sized by LOC and
// colored by language; `imports` edges between files are drawn with
// arrowheads. External modules and definitions are not drawn.
//
#pragma once

#include <filesystem>
#include <string>

#include "seiri/graph/graph.hpp"

namespace seiri
{

struct SvgLayout
{
  double width = 1200.0;
  double height = 900.0;
  double margin = 50.0;
  double min_node_radius = 20.0;
  double max_node_radius = 40.0;
};

/// Radius for a file of `loc` lines, linear between the layout bounds
[[nodiscard]] double node_radius(
  uint32_t loc, uint32_t min_loc, uint32_t max_loc, const SvgLayout & layout = {});

/// Render the graph as a standalone SVG document
[[nodiscard]] std::string render_svg(const Graph & graph, const SvgLayout & layout = {});

struct SvgWriteResult
{
  bool success = false;
  std::string error;

  static SvgWriteResult ok() { return {true, {}}; }
  static SvgWriteResult fail(std::string msg) { return {false, std::move(msg)}; }
};

/// Render and write to `path`
[[nodiscard]] SvgWriteResult write_svg(
  const Graph & graph, const std::filesystem::path & path, const SvgLayout & layout = {});

}  // namespace seiri

// seiri/export/svg_exporter.cpp - SVG rendering with tinyxml2
#include "seiri/export/svg_exporter.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <set>
#include <unordered_map>
#include <vector>

#include "seiri/basic/language.hpp"
#include "tinyxml2.h"

namespace seiri
{

namespace
{

constexpr double k_pi = 3.14159265358979323846;
constexpr double k_legend_spacing = 25.0;

std::string num(double v) { return fmt::format("{:.2f}", v); }

struct Point
{
  double x = 0.0;
  double y = 0.0;
};

std::string stem_of(const std::string & path)
{
  return std::filesystem::path(path).stem().string();
}

std::string file_name_of(const std::string & path)
{
  return std::filesystem::path(path).filename().string();
}

tinyxml2::XMLElement * append_text(
  tinyxml2::XMLDocument & doc, tinyxml2::XMLElement * parent, double x, double y,
  const std::string & text)
{
  auto * elem = doc.NewElement("text");
  elem->SetAttribute("x", num(x).c_str());
  elem->SetAttribute("y", num(y).c_str());
  elem->SetAttribute("dominant-baseline", "middle");
  elem->SetAttribute("font-family", "Arial");
  elem->SetAttribute("font-size", 12);
  elem->SetText(text.c_str());
  parent->InsertEndChild(elem);
  return elem;
}

void append_marker(tinyxml2::XMLDocument & doc, tinyxml2::XMLElement * svg)
{
  auto * defs = doc.NewElement("defs");
  auto * marker = doc.NewElement("marker");
  marker->SetAttribute("id", "arrowhead");
  marker->SetAttribute("markerWidth", 10);
  marker->SetAttribute("markerHeight", 7);
  marker->SetAttribute("refX", 10);
  marker->SetAttribute("refY", "3.5");
  marker->SetAttribute("orient", "auto");

  auto * arrow = doc.NewElement("path");
  arrow->SetAttribute("d", "M0,0 L10,3.5 L0,7 z");
  arrow->SetAttribute("fill", "lightblue");
  marker->InsertEndChild(arrow);
  defs->InsertEndChild(marker);
  svg->InsertEndChild(defs);
}

}  // namespace

double node_radius(uint32_t loc, uint32_t min_loc, uint32_t max_loc, const SvgLayout & layout)
{
  if (max_loc <= min_loc) {
    return layout.min_node_radius;
  }
  const double t = static_cast<double>(std::clamp(loc, min_loc, max_loc) - min_loc) /
                   static_cast<double>(max_loc - min_loc);
  return layout.min_node_radius + t * (layout.max_node_radius - layout.min_node_radius);
}

std::string render_svg(const Graph & graph, const SvgLayout & layout)
{
  std::vector<const Node *> files;
  for (const auto & node : graph.nodes()) {
    if (node.kind() == NodeKind::File) {
      files.push_back(&node);
    }
  }

  tinyxml2::XMLDocument doc;
  auto * svg = doc.NewElement("svg");
  svg->SetAttribute("xmlns", "http://www.w3.org/2000/svg");
  svg->SetAttribute("width", static_cast<int>(layout.width));
  svg->SetAttribute("height", static_cast<int>(layout.height));
  svg->SetAttribute(
    "viewBox", fmt::format("0 0 {} {}", static_cast<int>(layout.width),
                           static_cast<int>(layout.height))
                 .c_str());
  svg->SetAttribute("style", "background-color: white");
  doc.InsertEndChild(svg);
  append_marker(doc, svg);

  // Layout
  const double radius =
    std::min(layout.height - 2.0 * layout.margin, layout.width - 2.0 * layout.margin) * 0.4;
  const Point center{layout.width / 2.0, layout.height / 2.0};

  std::unordered_map<NodeId, Point> positions;
  uint32_t min_loc = 0;
  uint32_t max_loc = 0;
  for (size_t i = 0; i < files.size(); ++i) {
    const double angle = static_cast<double>(i) * (2.0 * k_pi / static_cast<double>(files.size()));
    positions[files[i]->id] = {center.x + radius * std::cos(angle), center.y + radius * std::sin(angle)};

    const uint32_t loc = files[i]->as_file()->loc;
    min_loc = i == 0 ? loc : std::min(min_loc, loc);
    max_loc = i == 0 ? loc : std::max(max_loc, loc);
  }

  // Edges first so that nodes are drawn on top
  for (const auto & e : graph.edges()) {
    if (e.kind != EdgeKind::Imports) {
      continue;
    }
    const auto from = positions.find(e.source);
    const auto to = positions.find(e.target);
    if (from == positions.end() || to == positions.end()) {
      continue;
    }
    auto * line = doc.NewElement("line");
    line->SetAttribute("x1", num(from->second.x).c_str());
    line->SetAttribute("y1", num(from->second.y).c_str());
    line->SetAttribute("x2", num(to->second.x).c_str());
    line->SetAttribute("y2", num(to->second.y).c_str());
    line->SetAttribute("stroke", "lightblue");
    line->SetAttribute("stroke-width", 2);
    line->SetAttribute("marker-end", "url(#arrowhead)");
    svg->InsertEndChild(line);
  }

  // Nodes
  std::set<Language> present;
  for (const Node * node : files) {
    const auto * file = node->as_file();
    const Point p = positions[node->id];
    present.insert(file->language);

    auto * circle = doc.NewElement("circle");
    circle->SetAttribute("cx", num(p.x).c_str());
    circle->SetAttribute("cy", num(p.y).c_str());
    circle->SetAttribute("r", num(node_radius(file->loc, min_loc, max_loc, layout)).c_str());
    circle->SetAttribute("fill", std::string(language_color(file->language)).c_str());
    circle->SetAttribute("stroke", "black");
    circle->SetAttribute("stroke-width", 2);
    auto * title = doc.NewElement("title");
    title->SetText(file_name_of(file->path).c_str());
    circle->InsertEndChild(title);
    svg->InsertEndChild(circle);

    auto * label = append_text(doc, svg, p.x, p.y, stem_of(file->path));
    label->SetAttribute("text-anchor", "middle");
    label->SetAttribute("fill", "black");
  }

  // Legend: one row per language that occurs in the graph
  size_t row = 0;
  for (const Language lang : all_languages()) {
    if (present.count(lang) == 0) {
      continue;
    }
    const double y = layout.margin + static_cast<double>(row++) * k_legend_spacing;

    auto * dot = doc.NewElement("circle");
    dot->SetAttribute("cx", num(layout.margin).c_str());
    dot->SetAttribute("cy", num(y).c_str());
    dot->SetAttribute("r", 6);
    dot->SetAttribute("fill", std::string(language_color(lang)).c_str());
    dot->SetAttribute("stroke", "black");
    dot->SetAttribute("stroke-width", 1);
    svg->InsertEndChild(dot);

    append_text(doc, svg, layout.margin + 15.0, y, std::string(to_string(lang)));
  }

  tinyxml2::XMLPrinter printer;
  doc.Print(&printer);
  return std::string(printer.CStr());
}

SvgWriteResult write_svg(
  const Graph & graph, const std::filesystem::path & path, const SvgLayout & layout)
{
  std::ofstream out(path, std::ios::binary);
  if (!out) {
    return SvgWriteResult::fail(fmt::format("cannot open '{}' for writing", path.string()));
  }
  out << render_svg(graph, layout);
  if (!out) {
    return SvgWriteResult::fail(fmt::format("failed to write '{}'", path.string()));
  }
  return SvgWriteResult::ok();
}

}  // namespace seiri

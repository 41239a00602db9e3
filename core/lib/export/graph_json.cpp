// seiri/export/graph_json.cpp - JSON serialization implementation
//
#include "seiri/export/graph_json.hpp"

#include <cstdint>
#include <optional>

namespace seiri
{
namespace
{

using nlohmann::json;

// ============================================================================
// Helper functions
// ============================================================================

json j_range(SourceRange r)
{
  if (r.is_invalid()) {
    return json{{"start", nullptr}, {"end", nullptr}};
  }
  return json{{"start", r.get_begin().get_offset()}, {"end", r.get_end().get_offset()}};
}

SourceRange range_from(const json & j)
{
  // An empty object or two nulls is an unknown span; anything partial throws
  if (j.is_object() && (j.empty() || (j.at("start").is_null() && j.at("end").is_null()))) {
    return {};
  }
  return {j.at("start").get<uint32_t>(), j.at("end").get<uint32_t>()};
}

json j_node(const Graph & graph, const Node & n)
{
  json j{{"id", n.id}, {"key", n.key}, {"kind", std::string(to_string(n.kind()))}, {"name", n.name()}};

  if (const auto * f = n.as_file()) {
    j["file"] = f->path;
    j["language"] = std::string(to_string(f->language));
    j["loc"] = f->loc;
    j["definitions"] = f->definitions;
  } else if (const auto * d = n.as_definition()) {
    const auto * owner = graph.node(d->file).as_file();
    j["file"] = owner ? owner->path : std::string();
    if (owner) {
      j["language"] = std::string(to_string(owner->language));
    }
    j["definition_kind"] = std::string(to_string(d->kind));
    j["qualified_name"] = d->qualified_name;
    j["line"] = d->line;
    j["span"] = j_range(d->span);
  } else {
    j["file"] = nullptr;
  }
  return j;
}

}  // namespace

// ============================================================================
// Graph
// ============================================================================

json graph_to_json(const Graph & graph, const DiagnosticBag * diags, const GraphAnalysis * analysis)
{
  json nodes = json::array();
  for (const auto & n : graph.nodes()) {
    nodes.push_back(j_node(graph, n));
  }

  json edges = json::array();
  for (const auto & e : graph.edges()) {
    edges.push_back(json{{"source", e.source}, {"target", e.target}, {"kind", std::string(to_string(e.kind))}});
  }

  json j{
    {"version", k_graph_schema_version},
    {"nodes", std::move(nodes)},
    {"edges", std::move(edges)},
    {"diagnostics", diags ? diagnostics_to_json(*diags) : json::array()}};
  if (analysis) {
    j["analysis"] = analysis_to_json(*analysis);
  }
  return j;
}

GraphReadResult graph_from_json(const json & j)
{
  try {
    if (!j.is_object() || !j.contains("nodes") || !j.contains("edges")) {
      return GraphReadResult::fail("graph document needs 'nodes' and 'edges'");
    }
    if (j.value("version", 0) != k_graph_schema_version) {
      return GraphReadResult::fail("unsupported graph schema version");
    }

    Graph graph;
    for (const auto & jn : j.at("nodes")) {
      const auto kind = node_kind_from_string(jn.at("kind").get<std::string>());
      if (!kind) {
        return GraphReadResult::fail("unknown node kind: " + jn.at("kind").dump());
      }

      NodeId id = 0;
      switch (*kind) {
        case NodeKind::File: {
          const auto lang = language_from_string(jn.at("language").get<std::string>());
          if (!lang) {
            return GraphReadResult::fail("unknown language: " + jn.at("language").dump());
          }
          id = graph.add_file(jn.at("file").get<std::string>(), *lang, jn.value("loc", 0U));
          break;
        }
        case NodeKind::Definition: {
          const auto owner = graph.find_file(jn.at("file").get<std::string>());
          const auto def_kind =
            definition_kind_from_string(jn.at("definition_kind").get<std::string>());
          if (!owner || !def_kind) {
            return GraphReadResult::fail("definition without a known file or kind");
          }
          id = graph.add_definition(
            *owner, jn.at("qualified_name").get<std::string>(), *def_kind,
            range_from(jn.value("span", json::object())), jn.value("line", 0U));
          break;
        }
        case NodeKind::External:
          id = graph.add_external(jn.at("name").get<std::string>());
          break;
      }

      if (id != jn.at("id").get<NodeId>()) {
        return GraphReadResult::fail("node ids are not dense and ordered");
      }
    }

    for (const auto & je : j.at("edges")) {
      const auto kind = edge_kind_from_string(je.at("kind").get<std::string>());
      if (!kind) {
        return GraphReadResult::fail("unknown edge kind: " + je.at("kind").dump());
      }
      const auto source = je.at("source").get<NodeId>();
      const auto target = je.at("target").get<NodeId>();
      if (source >= graph.node_count() || target >= graph.node_count()) {
        return GraphReadResult::fail("edge refers to a missing node");
      }
      graph.add_edge(source, target, *kind);
    }

    return GraphReadResult::ok(std::move(graph));
  } catch (const json::exception & e) {
    return GraphReadResult::fail(std::string("malformed graph document: ") + e.what());
  }
}

// ============================================================================
// Facts
// ============================================================================

json fact_to_json(const Fact & fact, std::string_view file)
{
  json j{{"file", std::string(file)}, {"line", fact.line}};
  if (const auto * imp = fact.as_import()) {
    j["type"] = "import";
    j["module"] = imp->module;
    j["name"] = imp->name;
    j["alias"] = imp->alias;
    j["level"] = imp->level.value_or(0);
  } else if (const auto * def = fact.as_definition()) {
    j["type"] = "definition";
    j["kind"] = std::string(to_string(def->kind));
    j["name"] = def->name;
    j["qualified_name"] = def->qualified_name;
  } else if (const auto * ref = fact.as_reference()) {
    j["type"] = "reference";
    j["kind"] = std::string(to_string(ref->kind));
    j["qualified_name"] = ref->name;
    j["scope"] = ref->scope;
  }
  return j;
}

json facts_to_json(const FileIndex & index, const std::vector<FileFacts> & files)
{
  json out = json::array();
  for (const auto & ff : files) {
    const IndexedFile & f = index.file(ff.file);
    json facts = json::array();
    for (const auto & fact : ff.facts) {
      facts.push_back(fact_to_json(fact, f.relative));
    }
    out.push_back(json{
      {"file", f.relative},
      {"language", std::string(to_string(f.language))},
      {"parse_failed", ff.parse_failed},
      {"facts", std::move(facts)}});
  }
  return json{{"version", k_graph_schema_version}, {"files", std::move(out)}};
}

// ============================================================================
// Diagnostics / analysis
// ============================================================================

json diagnostics_to_json(const DiagnosticBag & diags)
{
  json out = json::array();
  for (const auto & d : diags) {
    json j{
      {"severity", std::string(to_string(d.severity))},
      {"kind", std::string(to_string(d.kind))},
      {"file", d.file.generic_string()},
      {"message", d.message}};
    if (d.position.is_valid()) {
      j["line"] = d.position.line;
      j["column"] = d.position.column;
    }
    out.push_back(std::move(j));
  }
  return out;
}

json analysis_to_json(const GraphAnalysis & analysis)
{
  json betweenness = json::array();
  for (const auto & [id, score] : analysis.betweenness) {
    betweenness.push_back(json{{"node", id}, {"score", score}});
  }
  return json{
    {"file_count", analysis.files.size()},
    {"component_count", analysis.component_count()},
    {"components", analysis.components},
    {"largest_component", analysis.largest_component},
    {"cycles", analysis.cycles()},
    {"betweenness", std::move(betweenness)}};
}

}  // namespace seiri

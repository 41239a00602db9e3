// seiri/graph/graph_assembler.cpp - Graph assembly
#include "seiri/graph/graph_assembler.hpp"

#include <initializer_list>
#include <optional>
#include <unordered_map>

namespace seiri
{

namespace
{

std::string parent_of(const std::string & qualified)
{
  const auto pos = qualified.rfind('.');
  return pos == std::string::npos ? std::string() : qualified.substr(0, pos);
}

std::string simple_name(const std::string & name)
{
  const auto pos = name.rfind('.');
  return pos == std::string::npos ? name : name.substr(pos + 1);
}

bool kind_allowed(ReferenceKind ref, DefinitionKind def)
{
  return ref == ReferenceKind::FunctionCall || def == DefinitionKind::Container;
}

/// Per-run lookup tables for reference matching
class ReferenceMatcher
{
public:
  ReferenceMatcher(const Graph & graph, std::unordered_map<std::string, std::vector<NodeId>> by_simple)
  : graph_(graph), by_simple_(std::move(by_simple))
  {
  }

  std::optional<NodeId> match(const std::string & path, const ReferenceFact & ref) const
  {
    const std::string name = strip_receiver(ref.name);
    if (name.empty()) {
      return std::nullopt;
    }

    // Same file: <enclosing scope>.<name> from the innermost scope outwards
    std::string scope = ref.scope;
    while (!scope.empty()) {
      if (auto id = local(path, scope + "." + name, ref.kind)) {
        return id;
      }
      scope = parent_of(scope);
    }
    if (auto id = local(path, name, ref.kind)) {
      return id;
    }

    // Project-wide by simple name, first in discovery order
    if (auto it = by_simple_.find(simple_name(name)); it != by_simple_.end()) {
      for (const NodeId id : it->second) {
        const auto * def = graph_.node(id).as_definition();
        if (def && kind_allowed(ref.kind, def->kind)) {
          return id;
        }
      }
    }
    return std::nullopt;
  }

private:
  std::optional<NodeId> local(
    const std::string & path, const std::string & qualified, ReferenceKind kind) const
  {
    for (const auto def_kind : {DefinitionKind::Function, DefinitionKind::Container}) {
      if (!kind_allowed(kind, def_kind)) {
        continue;
      }
      if (auto id = graph_.find_definition(path, qualified, def_kind)) {
        return id;
      }
    }
    return std::nullopt;
  }

  const Graph & graph_;
  std::unordered_map<std::string, std::vector<NodeId>> by_simple_;
};

}  // namespace

std::string strip_receiver(std::string_view name)
{
  bool stripped = true;
  while (stripped) {
    stripped = false;
    for (const std::string_view prefix : {"self.", "this.", "Self."}) {
      if (name.substr(0, prefix.size()) == prefix) {
        name.remove_prefix(prefix.size());
        stripped = true;
      }
    }
  }
  return std::string(name);
}

Graph GraphAssembler::assemble(
  const std::vector<FileFacts> & files,
  const std::vector<std::vector<Resolution>> & resolutions) const
{
  Graph graph;

  // File nodes first so their ids follow discovery order
  std::vector<NodeId> file_nodes(files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    const IndexedFile & f = index_.file(files[i].file);
    file_nodes[i] = graph.add_file(f.relative, f.language, files[i].loc);
  }

  // Definitions
  std::unordered_map<std::string, std::vector<NodeId>> by_simple;
  std::vector<std::vector<NodeId>> defs_per_file(files.size());
  for (size_t i = 0; i < files.size(); ++i) {
    for (const auto & fact : files[i].facts) {
      const auto * def = fact.as_definition();
      if (!def || def->qualified_name.empty()) {
        continue;
      }
      const size_t before = graph.node_count();
      const NodeId id =
        graph.add_definition(file_nodes[i], def->qualified_name, def->kind, fact.span, fact.line);
      defs_per_file[i].push_back(id);
      if (graph.node_count() > before) {
        by_simple[simple_name(def->qualified_name)].push_back(id);
      }
    }
  }

  // defines: enclosing container in the same file, else the file
  for (size_t i = 0; i < files.size(); ++i) {
    const std::string & path = index_.file(files[i].file).relative;
    for (const NodeId id : defs_per_file[i]) {
      const auto * def = graph.node(id).as_definition();
      const auto container =
        graph.find_definition(path, parent_of(def->qualified_name), DefinitionKind::Container);
      if (container && *container != id) {
        graph.add_edge(*container, id, EdgeKind::Defines);
      } else {
        graph.add_edge(file_nodes[i], id, EdgeKind::Defines);
      }
    }
  }

  // imports
  for (size_t i = 0; i < files.size() && i < resolutions.size(); ++i) {
    for (const auto & r : resolutions[i]) {
      switch (r.kind) {
        case ResolutionKind::File: {
          const IndexedFile & target = index_.file(r.file);
          if (auto id = graph.find_file(target.relative)) {
            graph.add_edge(file_nodes[i], *id, EdgeKind::Imports);
          }
          break;
        }
        case ResolutionKind::External:
          graph.add_edge(file_nodes[i], graph.add_external(r.external_module), EdgeKind::Imports);
          break;
        case ResolutionKind::SelfImport:
          break;
      }
    }
  }

  // references
  const ReferenceMatcher matcher(graph, std::move(by_simple));
  for (size_t i = 0; i < files.size(); ++i) {
    const std::string & path = index_.file(files[i].file).relative;
    for (const auto & fact : files[i].facts) {
      const auto * ref = fact.as_reference();
      if (!ref) {
        continue;
      }
      const auto target = matcher.match(path, *ref);
      if (!target) {
        continue;
      }

      NodeId source = file_nodes[i];
      if (!ref->scope.empty()) {
        if (auto fn = graph.find_definition(path, ref->scope, DefinitionKind::Function)) {
          source = *fn;
        } else if (auto c = graph.find_definition(path, ref->scope, DefinitionKind::Container)) {
          source = *c;
        }
      }
      if (source != *target) {
        graph.add_edge(source, *target, EdgeKind::References);
      }
    }
  }

  return graph;
}

}  // namespace seiri

// seiri/graph/graph.cpp - Graph storage
#include "seiri/graph/graph.hpp"

#include <algorithm>

namespace seiri
{

std::string_view to_string(NodeKind kind) noexcept
{
  switch (kind) {
    case NodeKind::File:
      return "file";
    case NodeKind::Definition:
      return "definition";
    case NodeKind::External:
      return "external";
  }
  return "file";
}

std::string_view to_string(EdgeKind kind) noexcept
{
  switch (kind) {
    case EdgeKind::Imports:
      return "imports";
    case EdgeKind::References:
      return "references";
    case EdgeKind::Defines:
      return "defines";
  }
  return "imports";
}

std::optional<NodeKind> node_kind_from_string(std::string_view s)
{
  if (s == "file") return NodeKind::File;
  if (s == "definition") return NodeKind::Definition;
  if (s == "external") return NodeKind::External;
  return std::nullopt;
}

std::optional<EdgeKind> edge_kind_from_string(std::string_view s)
{
  if (s == "imports") return EdgeKind::Imports;
  if (s == "references") return EdgeKind::References;
  if (s == "defines") return EdgeKind::Defines;
  return std::nullopt;
}

std::string file_key(std::string_view path) { return "file:" + std::string(path); }

std::string definition_key(
  std::string_view path, std::string_view qualified_name, DefinitionKind kind)
{
  std::string key = "def:";
  key += path;
  key += '#';
  key += qualified_name;
  key += '@';
  key += to_string(kind);
  return key;
}

std::string external_key(std::string_view module) { return "ext:" + std::string(module); }

std::string Node::name() const
{
  if (const auto * f = as_file()) {
    return f->path;
  }
  if (const auto * d = as_definition()) {
    const auto pos = d->qualified_name.rfind('.');
    return pos == std::string::npos ? d->qualified_name : d->qualified_name.substr(pos + 1);
  }
  if (const auto * e = as_external()) {
    return e->module;
  }
  return {};
}

// ============================================================================
// Graph
// ============================================================================

NodeId Graph::push(std::string key, decltype(Node::data) data)
{
  Node n;
  n.id = static_cast<NodeId>(nodes_.size());
  n.key = key;
  n.data = std::move(data);
  by_key_.emplace(std::move(key), n.id);
  nodes_.push_back(std::move(n));
  return nodes_.back().id;
}

NodeId Graph::add_file(const std::string & path, Language language, uint32_t loc)
{
  std::string key = file_key(path);
  if (auto it = by_key_.find(key); it != by_key_.end()) {
    return it->second;
  }
  FileNode f;
  f.path = path;
  f.language = language;
  f.loc = loc;
  return push(std::move(key), std::move(f));
}

NodeId Graph::add_definition(
  NodeId file, const std::string & qualified_name, DefinitionKind kind, SourceRange span,
  uint32_t line)
{
  const auto * owner = node(file).as_file();
  const std::string path = owner ? owner->path : std::string();
  std::string key = definition_key(path, qualified_name, kind);

  if (auto it = by_key_.find(key); it != by_key_.end()) {
    auto & existing = std::get<DefinitionNode>(nodes_[it->second].data);
    if (span.is_valid()) {
      if (existing.span.is_valid()) {
        existing.span = SourceRange(
          std::min(existing.span.get_begin(), span.get_begin()),
          std::max(existing.span.get_end(), span.get_end()));
      } else {
        existing.span = span;
      }
    }
    if (line > 0 && (existing.line == 0 || line < existing.line)) {
      existing.line = line;
    }
    return it->second;
  }

  DefinitionNode d;
  d.qualified_name = qualified_name;
  d.kind = kind;
  d.file = file;
  d.span = span;
  d.line = line;
  return push(std::move(key), std::move(d));
}

NodeId Graph::add_external(const std::string & module)
{
  std::string key = external_key(module);
  if (auto it = by_key_.find(key); it != by_key_.end()) {
    return it->second;
  }
  return push(std::move(key), ExternalModuleNode{module});
}

bool Graph::add_edge(NodeId source, NodeId target, EdgeKind kind)
{
  if (source >= nodes_.size() || target >= nodes_.size()) {
    return false;
  }
  const Edge e{source, target, kind};
  if (!edge_set_.insert(e).second) {
    return false;
  }
  edges_.push_back(e);

  // Keep the file's top-level definition list in sync
  if (kind == EdgeKind::Defines) {
    if (auto * f = std::get_if<FileNode>(&nodes_[source].data)) {
      f->definitions.push_back(target);
    }
  }
  return true;
}

bool Graph::has_edge(NodeId source, NodeId target, EdgeKind kind) const
{
  return edge_set_.count(Edge{source, target, kind}) > 0;
}

std::optional<NodeId> Graph::find(std::string_view key) const
{
  if (auto it = by_key_.find(std::string(key)); it != by_key_.end()) {
    return it->second;
  }
  return std::nullopt;
}

std::optional<NodeId> Graph::find_file(std::string_view path) const
{
  return find(file_key(path));
}

std::optional<NodeId> Graph::find_definition(
  std::string_view path, std::string_view qualified_name, DefinitionKind kind) const
{
  return find(definition_key(path, qualified_name, kind));
}

size_t Graph::count_nodes(NodeKind kind) const
{
  return static_cast<size_t>(std::count_if(
    nodes_.begin(), nodes_.end(), [kind](const Node & n) { return n.kind() == kind; }));
}

size_t Graph::count_edges(EdgeKind kind) const
{
  return static_cast<size_t>(std::count_if(
    edges_.begin(), edges_.end(), [kind](const Edge & e) { return e.kind == kind; }));
}

}  // namespace seiri

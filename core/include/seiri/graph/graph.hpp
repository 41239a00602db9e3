// seiri/graph/graph.hpp - Language-agnostic dependency graph
//
// Owns every node and edge. Nodes are addressed by dense ids (stable for a
// given input) and by a string key:
//   file:<path>   def:<path>#<qualified>@<kind>   ext:<module>
//
#pragma once

#include <gsl/span>

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <tuple>
#include <unordered_map>
#include <variant>
#include <vector>

#include "seiri/basic/language.hpp"
#include "seiri/basic/source_manager.hpp"
#include "seiri/extract/fact.hpp"

namespace seiri
{

using NodeId = uint32_t;

enum class NodeKind : uint8_t {
  File,
  Definition,
  External,
};

enum class EdgeKind : uint8_t {
  Imports,
  References,
  Defines,
};

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;
[[nodiscard]] std::string_view to_string(EdgeKind kind) noexcept;
[[nodiscard]] std::optional<NodeKind> node_kind_from_string(std::string_view s);
[[nodiscard]] std::optional<EdgeKind> edge_kind_from_string(std::string_view s);

// ============================================================================
// Node payloads
// ============================================================================

struct FileNode
{
  std::string path;  ///< project-relative
  Language language = Language::Python;
  uint32_t loc = 0;
  /// Definitions attached directly to the file by a `defines` edge
  std::vector<NodeId> definitions;
};

struct DefinitionNode
{
  std::string qualified_name;
  DefinitionKind kind = DefinitionKind::Function;
  NodeId file = 0;  ///< owning FileNode
  SourceRange span;
  uint32_t line = 0;  ///< 1-based line of the first occurrence
};

struct ExternalModuleNode
{
  std::string module;
};

struct Node
{
  NodeId id = 0;
  std::string key;
  std::variant<FileNode, DefinitionNode, ExternalModuleNode> data;

  [[nodiscard]] NodeKind kind() const noexcept { return static_cast<NodeKind>(data.index()); }

  [[nodiscard]] const FileNode * as_file() const { return std::get_if<FileNode>(&data); }
  [[nodiscard]] const DefinitionNode * as_definition() const
  {
    return std::get_if<DefinitionNode>(&data);
  }
  [[nodiscard]] const ExternalModuleNode * as_external() const
  {
    return std::get_if<ExternalModuleNode>(&data);
  }

  /// Display name: file path, last qualified segment, or module name
  [[nodiscard]] std::string name() const;
};

struct Edge
{
  NodeId source = 0;
  NodeId target = 0;
  EdgeKind kind = EdgeKind::Imports;

  bool operator==(const Edge & o) const
  {
    return source == o.source && target == o.target && kind == o.kind;
  }
  bool operator<(const Edge & o) const
  {
    return std::tie(source, target, kind) < std::tie(o.source, o.target, o.kind);
  }
};

// ============================================================================
// Graph
// ============================================================================

class Graph
{
public:
  Graph() = default;

  /// Get or create the FileNode for a project-relative path
  NodeId add_file(const std::string & path, Language language, uint32_t loc);

  /**
   * Get or create the DefinitionNode for (file, qualified name, kind).
   * Re-encountering the triple widens the stored span instead of
   * duplicating the node.
   */
  NodeId add_definition(
    NodeId file, const std::string & qualified_name, DefinitionKind kind, SourceRange span,
    uint32_t line);

  /// Get or create the ExternalModuleNode for a module name
  NodeId add_external(const std::string & module);

  /// Add an edge; returns false if (source, target, kind) already exists
  bool add_edge(NodeId source, NodeId target, EdgeKind kind);

  [[nodiscard]] bool has_edge(NodeId source, NodeId target, EdgeKind kind) const;

  [[nodiscard]] std::optional<NodeId> find(std::string_view key) const;
  [[nodiscard]] std::optional<NodeId> find_file(std::string_view path) const;
  [[nodiscard]] std::optional<NodeId> find_definition(
    std::string_view path, std::string_view qualified_name, DefinitionKind kind) const;

  [[nodiscard]] const Node & node(NodeId id) const { return nodes_.at(id); }

  [[nodiscard]] gsl::span<const Node> nodes() const noexcept
  {
    return {nodes_.data(), nodes_.size()};
  }
  [[nodiscard]] gsl::span<const Edge> edges() const noexcept
  {
    return {edges_.data(), edges_.size()};
  }

  [[nodiscard]] size_t node_count() const noexcept { return nodes_.size(); }
  [[nodiscard]] size_t edge_count() const noexcept { return edges_.size(); }
  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }

  [[nodiscard]] size_t count_nodes(NodeKind kind) const;
  [[nodiscard]] size_t count_edges(EdgeKind kind) const;

private:
  NodeId push(std::string key, decltype(Node::data) data);

  std::vector<Node> nodes_;
  std::vector<Edge> edges_;
  std::unordered_map<std::string, NodeId> by_key_;
  std::set<Edge> edge_set_;
};

[[nodiscard]] std::string file_key(std::string_view path);
[[nodiscard]] std::string definition_key(
  std::string_view path, std::string_view qualified_name, DefinitionKind kind);
[[nodiscard]] std::string external_key(std::string_view module);

}  // namespace seiri

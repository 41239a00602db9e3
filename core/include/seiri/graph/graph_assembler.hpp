// seiri/graph/graph_assembler.hpp - Facts and resolutions to a Graph
#pragma once

#include <string>
#include <vector>

#include "seiri/extract/fact.hpp"
#include "seiri/graph/graph.hpp"
#include "seiri/resolve/file_index.hpp"
#include "seiri/resolve/path_resolver.hpp"

namespace seiri
{

/// Normalized facts of one discovered file
struct FileFacts
{
  size_t file = 0;  ///< index into the FileIndex
  uint32_t loc = 0;
  bool parse_failed = false;
  FactList facts;
};

/**
 * Builds the final Graph.
 *
 * - Every indexed file gets a FileNode, parse failures included.
 * - Definitions become DefinitionNodes with a `defines` edge from the
 *   enclosing container when it lives in the same file, else from the
 *   FileNode.
 * - Resolved imports become `imports` edges to FileNodes or to shared
 *   ExternalModuleNodes.
 * - References are matched by qualified name in the same file first, then
 *   project-wide by simple name in discovery order. Unmatched references
 *   are dropped.
 *
 * Never fails; inconsistent input only means fewer edges.
 */
class GraphAssembler
{
public:
  explicit GraphAssembler(const FileIndex & index) : index_(index) {}

  /**
   * @param files One entry per indexed file, in discovery order
   * @param resolutions resolutions[i] holds one entry per import fact of
   *                    files[i], in fact order
   */
  [[nodiscard]] Graph assemble(
    const std::vector<FileFacts> & files,
    const std::vector<std::vector<Resolution>> & resolutions) const;

private:
  const FileIndex & index_;
};

/// Name with `self.`, `this.` and `Self.` receivers removed
[[nodiscard]] std::string strip_receiver(std::string_view name);

}  // namespace seiri

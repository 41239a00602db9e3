// seiri/resolve/path_resolver.hpp - Import statement to project file
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "seiri/extract/fact.hpp"
#include "seiri/resolve/file_index.hpp"

namespace seiri
{

enum class ResolutionKind : uint8_t {
  File,        ///< resolved to a project file
  External,    ///< no project file; recorded as an external module
  SelfImport,  ///< resolved to the importing file; produces no edge
};

struct Resolution
{
  ResolutionKind kind = ResolutionKind::External;
  size_t file = 0;              ///< index into the FileIndex (kind == File)
  std::string external_module;  ///< canonical external name (kind == External)

  static Resolution to_file(size_t index) { return {ResolutionKind::File, index, {}}; }
  static Resolution to_external(std::string module)
  {
    return {ResolutionKind::External, 0, std::move(module)};
  }
  static Resolution self_import(size_t index) { return {ResolutionKind::SelfImport, index, {}}; }
};

/**
 * Maps normalized imports onto the file index.
 *
 * 1. level > 0: walk up (level - 1) directories from the importing file and
 *    try the language's candidate files for the module path.
 * 2. Otherwise (or if 1 found nothing): match the module name against the
 *    module keys of every file in the same language family, longest dotted
 *    prefix first. Among several matches the nearest directory wins, then
 *    the lexicographically smallest path.
 * 3. No match: an external module keyed by the canonical module name.
 *
 * Stateless apart from the index reference; safe to share across threads.
 */
class PathResolver
{
public:
  explicit PathResolver(const FileIndex & index) : index_(index) {}

  [[nodiscard]] Resolution resolve(const ImportFact & imp, size_t importer) const;

  /// One Resolution per import fact of `facts`, in order
  [[nodiscard]] std::vector<Resolution> resolve_file(const FactList & facts, size_t importer) const;

private:
  [[nodiscard]] std::optional<size_t> resolve_relative(
    const std::vector<std::string> & lookups, int level, const IndexedFile & from) const;
  [[nodiscard]] std::optional<size_t> resolve_absolute(
    const std::vector<std::string> & lookups, const IndexedFile & from) const;

  [[nodiscard]] std::vector<std::string> candidate_files(
    const std::string & base, Language lang) const;

  const FileIndex & index_;
};

/// Module names to try for an import, most specific first
[[nodiscard]] std::vector<std::string> lookup_names(const ImportFact & imp, Language lang);

/// Directory hops between two relative directories
[[nodiscard]] size_t directory_distance(const std::string & from_dir, const std::string & to_dir);

}  // namespace seiri

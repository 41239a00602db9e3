// seiri/resolve/file_index.hpp - Immutable snapshot of the project file set
//
// Built once after discovery and read-only afterwards, so resolver lookups
// may run on several threads without locking.
//
#pragma once

#include <gsl/span>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "seiri/basic/language.hpp"

namespace seiri
{

/// One entry of the ordered discovery result
struct DiscoveredFile
{
  std::filesystem::path path;
  Language language = Language::Python;
};

struct IndexedFile
{
  std::filesystem::path path;  ///< as discovered
  std::string relative;        ///< project-root-relative, '/'-separated
  Language language = Language::Python;

  /// Module names this file answers to (`pkg.mod`, `a/b`, `include/x.h`)
  std::vector<std::string> module_keys;

  /// Relative directory ("" for files at the root)
  [[nodiscard]] std::string directory() const;
};

class FileIndex
{
public:
  FileIndex() = default;

  /**
   * @param files Discovery result, in discovery order
   * @param root Project root; defaults to the deepest common ancestor
   *             directory of all files
   */
  explicit FileIndex(
    const std::vector<DiscoveredFile> & files,
    const std::optional<std::filesystem::path> & root = std::nullopt);

  [[nodiscard]] const std::filesystem::path & root() const noexcept { return root_; }
  [[nodiscard]] size_t size() const noexcept { return files_.size(); }
  [[nodiscard]] bool empty() const noexcept { return files_.empty(); }

  [[nodiscard]] const IndexedFile & file(size_t i) const { return files_.at(i); }
  [[nodiscard]] gsl::span<const IndexedFile> files() const noexcept
  {
    return {files_.data(), files_.size()};
  }

  /// Lookup by project-relative path
  [[nodiscard]] std::optional<size_t> find_relative(std::string_view relative) const;

private:
  std::filesystem::path root_;
  std::vector<IndexedFile> files_;
  std::unordered_map<std::string, size_t> by_relative_;
};

/// Module keys a file at `relative` answers to
[[nodiscard]] std::vector<std::string> module_keys_for(
  std::string_view relative, Language language);

/// Deepest directory containing every path (paths made absolute first)
[[nodiscard]] std::filesystem::path common_root(const std::vector<std::filesystem::path> & paths);

}  // namespace seiri

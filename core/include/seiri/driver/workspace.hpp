// seiri/driver/workspace.hpp - Incremental analysis workspace
//
// Keeps each file's normalized facts keyed by path and content. Updating a
// file re-extracts only that file; build() re-runs resolution and assembly
// over the cached facts.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "seiri/driver/analyzer.hpp"

namespace seiri
{

class Workspace
{
public:
  explicit Workspace(AnalyzeOptions options = {});
  ~Workspace();

  Workspace(const Workspace &) = delete;
  Workspace & operator=(const Workspace &) = delete;

  Workspace(Workspace && other) noexcept;
  Workspace & operator=(Workspace && other) noexcept;

  /**
   * Add or replace a file. The language comes from the extension.
   *
   * @return true if the file was (re-)extracted, false if the content was
   *         unchanged or the extension is not supported
   */
  bool set_file(const std::filesystem::path & path, std::string content);

  /// Same as set_file() with an explicit language
  bool set_file(const std::filesystem::path & path, Language language, std::string content);

  /// Drop a file and its facts; returns false if it was not present
  bool remove_file(const std::filesystem::path & path);

  [[nodiscard]] bool has_file(const std::filesystem::path & path) const;
  [[nodiscard]] size_t file_count() const;

  /// Number of extractions performed so far
  [[nodiscard]] size_t extraction_count() const;

  /// Normalized facts currently cached for a file
  [[nodiscard]] std::optional<FactList> facts(const std::filesystem::path & path) const;

  /// Resolve and assemble the current file set (files ordered by path)
  [[nodiscard]] AnalyzeResult build() const;

private:
  struct Impl;
  Impl * impl_;
};

}  // namespace seiri

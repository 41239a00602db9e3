// seiri/driver/file_discovery.hpp - Project file discovery
//
// Recursive walk producing the ordered (path, language) set the engine
// consumes. Hidden entries and excluded names are skipped; `.gitignore`
// rules are not interpreted.
//
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "seiri/basic/diagnostic.hpp"
#include "seiri/extract/language_adapter.hpp"
#include "seiri/resolve/file_index.hpp"

namespace seiri
{

struct DiscoveryOptions
{
  /// File or directory names skipped anywhere in the tree
  std::vector<std::string> exclude;

  /// Record an UnsupportedLanguage info for every skipped file
  bool report_unsupported = false;
};

struct DiscoveryResult
{
  /// Supported files, sorted by path
  std::vector<DiscoveredFile> files;
  DiagnosticBag diagnostics;

  /// false only if the root could not be read at all
  bool success = false;
  std::string error;
};

/**
 * Walk `root` and select files by extension through `registry`.
 *
 * A regular file passed as `root` is returned on its own when supported.
 */
[[nodiscard]] DiscoveryResult discover_files(
  const std::filesystem::path & root, const AdapterRegistry & registry,
  const DiscoveryOptions & options = {});

}  // namespace seiri

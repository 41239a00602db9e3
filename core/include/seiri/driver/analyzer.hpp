// seiri/driver/analyzer.hpp - Analysis driver
//
// Single entry point for the extraction -> resolution -> assembly pipeline.
// Used by the CLI, the incremental Workspace and the tests.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "seiri/analysis/graph_analysis.hpp"
#include "seiri/basic/diagnostic.hpp"
#include "seiri/extract/extractor.hpp"
#include "seiri/extract/language_adapter.hpp"
#include "seiri/graph/graph.hpp"
#include "seiri/graph/graph_assembler.hpp"
#include "seiri/project/project_config.hpp"
#include "seiri/resolve/file_index.hpp"

namespace seiri
{

// ============================================================================
// Analyze Options
// ============================================================================

struct AnalyzeOptions
{
  /// Project root for module keys (default: common ancestor of all files)
  std::optional<std::filesystem::path> root;

  /// Worker threads for extraction and resolution (0 = hardware concurrency)
  unsigned jobs = 0;

  /// Per-language extension overrides
  std::map<Language, std::vector<std::string>> languages;

  /// Names skipped during discovery
  std::vector<std::string> exclude = {"build", "target", "node_modules", ".git"};

  bool report_unsupported = false;
  bool report_unresolved = false;

  /// Compute the SCC/betweenness summary
  bool analyze = false;

  /// Options equivalent to a loaded seiri.yaml
  [[nodiscard]] static AnalyzeOptions from_config(const ProjectConfig & config);

  /// Builtin adapters with the extension overrides applied
  [[nodiscard]] AdapterRegistry make_registry() const;
};

// ============================================================================
// Analyze Result
// ============================================================================

struct AnalyzeResult
{
  /// false only on a fatal precondition failure (unreadable root)
  bool success = false;

  /// Fatal error message (success == false)
  std::string error;

  FileIndex index;

  /// One entry per indexed file, in discovery order
  std::vector<FileFacts> files;

  Graph graph;

  /// Per-file diagnostics, in discovery order
  DiagnosticBag diagnostics;

  std::optional<GraphAnalysis> analysis;

  [[nodiscard]] size_t parse_failures() const;

  /// 0 clean, 2 graph produced with warnings or errors, 1 fatal
  [[nodiscard]] int exit_status() const;
};

// ============================================================================
// Analyzer
// ============================================================================

/**
 * Runs the two-phase pipeline.
 *
 * Phase one extracts and normalizes every file independently on a worker
 * pool. Phase two builds the immutable FileIndex, resolves every import
 * against it (also in parallel) and assembles the Graph sequentially.
 */
class Analyzer
{
public:
  /**
   * Discover and analyze everything under `root`.
   *
   * @param root Project directory (or a single source file)
   */
  [[nodiscard]] static AnalyzeResult analyze_directory(
    const std::filesystem::path & root, const AnalyzeOptions & options);

  /**
   * Analyze an already discovered file set, reading each file from disk.
   * Unreadable files are recorded as Io warnings and keep an empty node.
   */
  [[nodiscard]] static AnalyzeResult analyze_files(
    const std::vector<DiscoveredFile> & files, const AnalyzeOptions & options);

  /**
   * Phase two only: resolve and assemble already extracted files.
   *
   * @param files Discovery result, in discovery order
   * @param extractions extractions[i] belongs to files[i]
   */
  [[nodiscard]] static AnalyzeResult link(
    const std::vector<DiscoveredFile> & files, std::vector<FileExtraction> extractions,
    const AnalyzeOptions & options);
};

}  // namespace seiri

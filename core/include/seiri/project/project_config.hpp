// seiri/project/project_config.hpp - Project configuration (seiri.yaml)
//
// Parses and validates seiri.yaml. Every section is optional; command-line
// flags override the values loaded here.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "seiri/basic/language.hpp"

namespace seiri
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class OutputFormat : uint8_t {
  Json,
  Svg,
  Facts,
};

[[nodiscard]] std::string_view to_string(OutputFormat format) noexcept;
[[nodiscard]] std::optional<OutputFormat> output_format_from_string(std::string_view s);

/**
 * Project metadata section.
 */
struct ProjectSection
{
  std::string name;

  /// Analysis root; empty means the directory containing seiri.yaml
  std::filesystem::path root;
};

/**
 * Analysis section.
 */
struct AnalysisConfig
{
  /// Per-language extension overrides (extensions without the dot)
  std::map<Language, std::vector<std::string>> languages;

  /// Directory or file names skipped during discovery
  std::vector<std::string> exclude = {"build", "target", "node_modules", ".git"};

  /// Worker count; 0 = hardware concurrency
  unsigned jobs = 0;

  bool report_unsupported = false;
  bool report_unresolved = false;
};

struct OutputConfig
{
  OutputFormat format = OutputFormat::Json;

  /// Empty means stdout
  std::filesystem::path path;
};

/**
 * Complete project configuration (seiri.yaml).
 */
struct ProjectConfig
{
  ProjectSection project;
  AnalysisConfig analysis;
  OutputConfig output;

  /// Directory containing seiri.yaml (relative paths resolve against it)
  std::filesystem::path config_dir;

  /// Absolute analysis root
  [[nodiscard]] std::filesystem::path resolved_root() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a seiri.yaml file.
 *
 * @param config_path Path to seiri.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. `config_dir` anchors relative paths.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & config_dir);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to seiri.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "seiri.yaml";

}  // namespace seiri

// seiri/project/project_config.cpp - Project configuration implementation
//
#include "seiri/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <fstream>
#include <sstream>

#include "seiri/extract/language_adapter.hpp"

namespace seiri
{

namespace
{

/// Read a list of strings; fails on anything but a sequence of scalars
bool parse_string_list(
  const YAML::Node & node, const std::string & what, std::vector<std::string> & out,
  std::string & error)
{
  if (!node.IsSequence()) {
    error = what + " must be a list";
    return false;
  }
  out.clear();
  for (const auto & item : node) {
    if (!item.IsScalar()) {
      error = what + " entries must be strings";
      return false;
    }
    out.push_back(item.as<std::string>());
  }
  return true;
}

/// Parse 'analysis.languages' (language name -> extension list)
bool parse_languages(
  const YAML::Node & node, std::map<Language, std::vector<std::string>> & out, std::string & error)
{
  if (!node.IsMap()) {
    error = "analysis.languages must be a map of language to extension list";
    return false;
  }
  for (const auto & entry : node) {
    const auto name = entry.first.as<std::string>();
    const auto lang = language_from_string(name);
    if (!lang) {
      error = "unknown language in analysis.languages: '" + name + "'";
      return false;
    }
    std::vector<std::string> exts;
    if (!parse_string_list(entry.second, "analysis.languages." + name, exts, error)) {
      return false;
    }
    for (auto & ext : exts) {
      if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
      }
      ext = extension_of("x." + ext);
    }
    out[*lang] = std::move(exts);
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & config_dir)
{
  ProjectConfig config;
  config.config_dir = config_dir;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("seiri.yaml must contain a map at the top level");
  }

  std::string error;

  // Parse 'project' section
  if (const auto & proj = root["project"]) {
    if (!proj.IsMap()) {
      return ConfigLoadResult::fail("project must be a map");
    }
    if (proj["name"]) {
      config.project.name = proj["name"].as<std::string>();
    }
    if (proj["root"]) {
      config.project.root = proj["root"].as<std::string>();
    }
  }

  // Parse 'analysis' section
  if (const auto & an = root["analysis"]) {
    if (!an.IsMap()) {
      return ConfigLoadResult::fail("analysis must be a map");
    }
    if (an["languages"] && !parse_languages(an["languages"], config.analysis.languages, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (an["exclude"] &&
        !parse_string_list(an["exclude"], "analysis.exclude", config.analysis.exclude, error)) {
      return ConfigLoadResult::fail(error);
    }
    if (an["jobs"]) {
      const int jobs = an["jobs"].as<int>();
      if (jobs < 0) {
        return ConfigLoadResult::fail("analysis.jobs must not be negative");
      }
      config.analysis.jobs = static_cast<unsigned>(jobs);
    }
    if (an["report_unsupported"]) {
      config.analysis.report_unsupported = an["report_unsupported"].as<bool>();
    }
    if (an["report_unresolved"]) {
      config.analysis.report_unresolved = an["report_unresolved"].as<bool>();
    }
  }

  // Parse 'output' section
  if (const auto & out = root["output"]) {
    if (!out.IsMap()) {
      return ConfigLoadResult::fail("output must be a map");
    }
    if (out["format"]) {
      const auto text = out["format"].as<std::string>();
      const auto format = output_format_from_string(text);
      if (!format) {
        return ConfigLoadResult::fail(
          "invalid output.format: '" + text + "' (must be 'json', 'svg' or 'facts')");
      }
      config.output.format = *format;
    }
    if (out["path"]) {
      config.output.path = out["path"].as<std::string>();
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::string_view to_string(OutputFormat format) noexcept
{
  switch (format) {
    case OutputFormat::Json:
      return "json";
    case OutputFormat::Svg:
      return "svg";
    case OutputFormat::Facts:
      return "facts";
  }
  return "json";
}

std::optional<OutputFormat> output_format_from_string(std::string_view s)
{
  if (s == "json") return OutputFormat::Json;
  if (s == "svg") return OutputFormat::Svg;
  if (s == "facts") return OutputFormat::Facts;
  return std::nullopt;
}

std::filesystem::path ProjectConfig::resolved_root() const
{
  if (project.root.empty()) {
    return config_dir;
  }
  if (project.root.is_absolute()) {
    return project.root.lexically_normal();
  }
  return (config_dir / project.root).lexically_normal();
}

ConfigLoadResult parse_project_config(
  std::string_view yaml_text, const std::filesystem::path & config_dir)
{
  YAML::Node root;
  try {
    root = YAML::Load(std::string(yaml_text));
    return parse_root(root, config_dir);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  std::ifstream in(config_path);
  if (!in.is_open()) {
    return ConfigLoadResult::fail("failed to open configuration file: " + config_path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  return parse_project_config(buffer.str(), fs::absolute(config_path).parent_path());
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace seiri

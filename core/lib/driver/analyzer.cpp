// seiri/driver/analyzer.cpp - Analysis driver implementation
//
#include "seiri/driver/analyzer.hpp"

#include <fmt/format.h>

#include <fstream>
#include <sstream>

#include "seiri/basic/parallel.hpp"
#include "seiri/driver/file_discovery.hpp"
#include "seiri/resolve/path_resolver.hpp"

namespace fs = std::filesystem;

namespace seiri
{

namespace
{

std::optional<std::string> read_file(const fs::path & path)
{
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) {
    return std::nullopt;
  }
  return buffer.str();
}

std::string describe_import(const ImportFact & imp)
{
  const std::string dots(static_cast<size_t>(imp.level.value_or(0)), '.');
  if (imp.module.empty()) {
    return dots + imp.name;
  }
  return imp.name.empty() ? dots + imp.module : dots + imp.module + " (" + imp.name + ")";
}

void report_unresolved(
  const IndexedFile & file, const FactList & facts, const std::vector<Resolution> & resolutions,
  DiagnosticBag & diags)
{
  size_t r = 0;
  for (const auto & fact : facts) {
    const auto * imp = fact.as_import();
    if (!imp) {
      continue;
    }
    if (r < resolutions.size() && resolutions[r].kind == ResolutionKind::External) {
      diags.report_info(
             DiagnosticKind::UnresolvedImport, file.path,
             fmt::format(
               "import '{}' does not match a project file; recorded as external module '{}'",
               describe_import(*imp), resolutions[r].external_module))
        .at({fact.line, 1});
    }
    ++r;
  }
}

}  // namespace

// ============================================================================
// AnalyzeOptions / AnalyzeResult
// ============================================================================

AnalyzeOptions AnalyzeOptions::from_config(const ProjectConfig & config)
{
  AnalyzeOptions options;
  options.root = config.resolved_root();
  options.jobs = config.analysis.jobs;
  options.languages = config.analysis.languages;
  options.exclude = config.analysis.exclude;
  options.report_unsupported = config.analysis.report_unsupported;
  options.report_unresolved = config.analysis.report_unresolved;
  return options;
}

AdapterRegistry AnalyzeOptions::make_registry() const
{
  AdapterRegistry registry = AdapterRegistry::with_builtin_adapters();
  for (const auto & [lang, exts] : languages) {
    registry.set_extensions(lang, exts);
  }
  return registry;
}

size_t AnalyzeResult::parse_failures() const
{
  size_t n = 0;
  for (const auto & f : files) {
    n += f.parse_failed ? 1 : 0;
  }
  return n;
}

int AnalyzeResult::exit_status() const
{
  if (!success) {
    return 1;
  }
  return diagnostics.has_errors() || diagnostics.has_warnings() ? 2 : 0;
}

// ============================================================================
// Analyzer
// ============================================================================

AnalyzeResult Analyzer::analyze_directory(const fs::path & root, const AnalyzeOptions & options)
{
  const AdapterRegistry registry = options.make_registry();

  DiscoveryOptions discovery_options;
  discovery_options.exclude = options.exclude;
  discovery_options.report_unsupported = options.report_unsupported;

  DiscoveryResult discovered = discover_files(root, registry, discovery_options);
  if (!discovered.success) {
    AnalyzeResult result;
    result.error = discovered.error;
    result.diagnostics.report_error(DiagnosticKind::Io, root, discovered.error);
    return result;
  }

  AnalyzeResult result = analyze_files(discovered.files, options);
  DiagnosticBag combined = std::move(discovered.diagnostics);
  combined.merge(std::move(result.diagnostics));
  result.diagnostics = std::move(combined);
  return result;
}

AnalyzeResult Analyzer::analyze_files(
  const std::vector<DiscoveredFile> & files, const AnalyzeOptions & options)
{
  const AdapterRegistry registry = options.make_registry();

  // Phase one: per-file extraction into pre-sized slots
  std::vector<FileExtraction> extractions(files.size());
  parallel_for(files.size(), options.jobs, [&](size_t i) {
    const DiscoveredFile & file = files[i];
    FileExtraction & slot = extractions[i];

    const LanguageAdapter * adapter = registry.find(file.language);
    if (!adapter) {
      slot.diagnostics.report_info(
        DiagnosticKind::UnsupportedLanguage, file.path,
        fmt::format("no {} adapter registered; file has no facts", to_string(file.language)));
      return;
    }

    auto content = read_file(file.path);
    if (!content) {
      slot.diagnostics.report_warning(DiagnosticKind::Io, file.path, "failed to read file");
      return;
    }
    slot = extract_file(*adapter, file.path, std::move(*content));
  });

  return link(files, std::move(extractions), options);
}

AnalyzeResult Analyzer::link(
  const std::vector<DiscoveredFile> & files, std::vector<FileExtraction> extractions,
  const AnalyzeOptions & options)
{
  AnalyzeResult result;
  result.index = FileIndex(files, options.root);

  result.files.resize(files.size());
  for (size_t i = 0; i < files.size() && i < extractions.size(); ++i) {
    FileFacts & ff = result.files[i];
    ff.file = i;
    ff.loc = extractions[i].loc;
    ff.parse_failed = extractions[i].parse_failed;
    ff.facts = std::move(extractions[i].facts);
  }

  // Phase two: resolution against the immutable index
  const PathResolver resolver(result.index);
  std::vector<std::vector<Resolution>> resolutions(result.files.size());
  parallel_for(result.files.size(), options.jobs, [&](size_t i) {
    resolutions[i] = resolver.resolve_file(result.files[i].facts, i);
  });

  for (size_t i = 0; i < result.files.size(); ++i) {
    if (i < extractions.size()) {
      result.diagnostics.merge(std::move(extractions[i].diagnostics));
    }
    if (options.report_unresolved) {
      report_unresolved(
        result.index.file(i), result.files[i].facts, resolutions[i], result.diagnostics);
    }
  }

  result.graph = GraphAssembler(result.index).assemble(result.files, resolutions);

  if (options.analyze) {
    result.analysis = analyze_graph(result.graph);
  }

  result.success = true;
  return result;
}

}  // namespace seiri

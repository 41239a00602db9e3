// seiri/extract/extractor.cpp - Per-file extraction
#include "seiri/extract/extractor.hpp"

#include "seiri/basic/source_manager.hpp"
#include "seiri/extract/fact_normalizer.hpp"

namespace seiri
{

FileExtraction extract_file(
  const LanguageAdapter & adapter, const std::filesystem::path & path, std::string content)
{
  FileExtraction out;
  const SourceFile source(path, std::move(content));
  out.loc = source.line_count();

  ExtractResult raw = adapter.extract(path, source.content());
  if (!raw.success) {
    out.parse_failed = true;
    const ParseError err = raw.error.value_or(ParseError{0, 0, "unparseable source", {}});
    {
      auto diag = out.diagnostics.report_warning(DiagnosticKind::ParseFailure, path, err.message);
      if (err.line > 0) {
        diag.at({err.line, err.column > 0 ? err.column : 1});
      }
      if (!err.source_line.empty()) {
        diag.with_source_line(err.source_line);
      }
      diag.with_help("the file keeps its node but contributes no facts");
    }  // builder commits here
    return out;
  }

  FactNormalizer normalizer(adapter.language, &out.diagnostics);
  out.facts = normalizer.normalize_all(raw.facts);
  return out;
}

}  // namespace seiri

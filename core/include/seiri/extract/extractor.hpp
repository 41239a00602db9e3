// seiri/extract/extractor.hpp - Per-file extraction (adapter + normalizer)
#pragma once

#include <filesystem>
#include <string>

#include "seiri/basic/diagnostic.hpp"
#include "seiri/extract/fact.hpp"
#include "seiri/extract/language_adapter.hpp"

namespace seiri
{

/// Everything one file contributes before resolution
struct FileExtraction
{
  FactList facts;  ///< normalized, in source order
  bool parse_failed = false;
  uint32_t loc = 0;
  DiagnosticBag diagnostics;
};

/**
 * Parse one file and normalize its facts.
 *
 * A parse failure is recorded as a ParseFailure warning and leaves `facts`
 * empty; it is never reported as an error of the run. Touches no shared
 * state, so distinct files may be extracted on different threads.
 */
[[nodiscard]] FileExtraction extract_file(
  const LanguageAdapter & adapter, const std::filesystem::path & path, std::string content);

}  // namespace seiri

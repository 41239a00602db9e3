// seiri/test_support/extract_helpers.hpp - helpers for adapter/normalizer tests
//
// Runs one in-memory source text through an adapter and the normalizer and
// offers typed views over the resulting facts.
//
#pragma once

#include <algorithm>
#include <string>
#include <string_view>
#include <vector>

#include "seiri/extract/extractor.hpp"
#include "seiri/extract/fact.hpp"
#include "seiri/extract/language_adapter.hpp"

namespace seiri::test_support
{

/// Normalized facts of `source`, parse failures included as `parse_failed`
[[nodiscard]] inline FileExtraction extract(
  const LanguageAdapter & adapter, std::string_view file, std::string_view source)
{
  return extract_file(adapter, std::string(file), std::string(source));
}

[[nodiscard]] inline std::vector<ImportFact> imports_of(const FactList & facts)
{
  std::vector<ImportFact> out;
  for (const auto & f : facts) {
    if (const auto * imp = f.as_import()) {
      out.push_back(*imp);
    }
  }
  return out;
}

[[nodiscard]] inline std::vector<DefinitionFact> definitions_of(const FactList & facts)
{
  std::vector<DefinitionFact> out;
  for (const auto & f : facts) {
    if (const auto * def = f.as_definition()) {
      out.push_back(*def);
    }
  }
  return out;
}

[[nodiscard]] inline std::vector<ReferenceFact> references_of(const FactList & facts)
{
  std::vector<ReferenceFact> out;
  for (const auto & f : facts) {
    if (const auto * ref = f.as_reference()) {
      out.push_back(*ref);
    }
  }
  return out;
}

/// Qualified names of every definition of `kind`, in source order
[[nodiscard]] inline std::vector<std::string> qualified_names(
  const FactList & facts, DefinitionKind kind)
{
  std::vector<std::string> out;
  for (const auto & def : definitions_of(facts)) {
    if (def.kind == kind) {
      out.push_back(def.qualified_name);
    }
  }
  return out;
}

[[nodiscard]] inline bool has_reference(
  const FactList & facts, ReferenceKind kind, std::string_view name, std::string_view scope)
{
  const auto refs = references_of(facts);
  return std::any_of(refs.begin(), refs.end(), [&](const ReferenceFact & r) {
    return r.kind == kind && r.name == name && r.scope == scope;
  });
}

[[nodiscard]] inline const ImportFact * find_import(
  const std::vector<ImportFact> & imports, std::string_view module, std::string_view name = {})
{
  for (const auto & imp : imports) {
    if (imp.module == module && imp.name == name) {
      return &imp;
    }
  }
  return nullptr;
}

}  // namespace seiri::test_support

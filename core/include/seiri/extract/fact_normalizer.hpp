// seiri/extract/fact_normalizer.hpp - Raw facts to the shared schema
#pragma once

#include <optional>
#include <string>
#include <vector>

#include "seiri/basic/diagnostic.hpp"
#include "seiri/basic/language.hpp"
#include "seiri/extract/fact.hpp"

namespace seiri
{

/**
 * Rewrites one file's raw facts into the shared schema.
 *
 * - Imports get a relative level (0 = absolute, 1 = same directory,
 *   2 = parent, ...) and a canonical module name (`.`-joined for dotted
 *   languages, `/`-joined for path languages).
 * - Definitions get a container-qualified name (`Outer.Inner.method`).
 * - References get the qualified name of their enclosing definition.
 *
 * Qualification uses an explicit stack of open definitions. Facts must be
 * fed in source order; a definition closes once a fact starts at or after
 * its end offset. One instance per file; reset() at end of file.
 *
 * Malformed facts are dropped and reported as MalformedFact warnings.
 * Normalizing an already normalized fact returns it unchanged.
 */
class FactNormalizer
{
public:
  explicit FactNormalizer(Language language, DiagnosticBag * diags = nullptr);

  [[nodiscard]] std::optional<Fact> normalize(const Fact & fact);

  /// Close every open scope (end of file)
  void reset() noexcept { scopes_.clear(); }

  /// Normalize a whole file's facts in order and reset afterwards
  [[nodiscard]] FactList normalize_all(const FactList & facts);

private:
  struct OpenScope
  {
    std::string qualified_name;
    DefinitionKind kind;
    uint32_t end_offset;
  };

  void close_scopes_before(const Fact & fact);
  void open_scope(const Fact & fact, const DefinitionFact & def);
  [[nodiscard]] std::string enclosing_container() const;

  [[nodiscard]] bool normalize_import(ImportFact & imp) const;
  [[nodiscard]] bool normalize_definition(DefinitionFact & def) const;
  [[nodiscard]] bool normalize_reference(ReferenceFact & ref) const;

  void report(const Fact & fact, std::string message);

  Language language_;
  DiagnosticBag * diags_;
  std::vector<OpenScope> scopes_;
};

/// `a::b->c` -> `a.b.c`
[[nodiscard]] std::string fold_member_separators(std::string_view name);

}  // namespace seiri

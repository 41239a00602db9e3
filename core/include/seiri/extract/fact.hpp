// seiri/extract/fact.hpp - Per-file observations extracted from a parse tree
//
// A Fact is either an import, a definition or a reference. Adapters produce
// raw facts in source order; the normalizer rewrites them into the shared
// schema (canonical module names, relative levels, qualified names).
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "seiri/basic/source_manager.hpp"

namespace seiri
{

enum class DefinitionKind : uint8_t {
  Function,
  Container,  ///< class, struct, enum, trait, interface, ...
};

enum class ReferenceKind : uint8_t {
  FunctionCall,
  ContainerUse,
};

[[nodiscard]] std::string_view to_string(DefinitionKind kind) noexcept;
[[nodiscard]] std::string_view to_string(ReferenceKind kind) noexcept;
[[nodiscard]] std::optional<DefinitionKind> definition_kind_from_string(std::string_view s);

// ============================================================================
// Payloads
// ============================================================================

struct ImportFact
{
  /// Raw text before normalization (`..pkg`, `crate::a`, `./x`, `"a.h"`);
  /// canonical module afterwards (`pkg`, `a`, `x`, `a.h`).
  std::string module;
  /// Imported item (`from m import name`); empty for whole-module imports
  std::string name;
  std::string alias;
  /// Relative level; unset until computed (0 = absolute, 1 = same directory)
  std::optional<int> level;

  bool operator==(const ImportFact & o) const
  {
    return module == o.module && name == o.name && alias == o.alias && level == o.level;
  }
};

struct DefinitionFact
{
  DefinitionKind kind = DefinitionKind::Function;
  std::string name;
  /// Explicit enclosing container written at the definition site (`A::f`)
  std::string container;
  /// Filled by the normalizer (`Outer.Inner.method`)
  std::string qualified_name;

  bool operator==(const DefinitionFact & o) const
  {
    return kind == o.kind && name == o.name && container == o.container &&
           qualified_name == o.qualified_name;
  }
};

struct ReferenceFact
{
  ReferenceKind kind = ReferenceKind::FunctionCall;
  /// Referenced name as written, `::`/`->` folded to `.` by the normalizer
  std::string name;
  /// Qualified name of the innermost enclosing definition (empty at top level)
  std::string scope;

  bool operator==(const ReferenceFact & o) const
  {
    return kind == o.kind && name == o.name && scope == o.scope;
  }
};

using FactData = std::variant<ImportFact, DefinitionFact, ReferenceFact>;

// ============================================================================
// Fact
// ============================================================================

struct Fact
{
  std::filesystem::path file;
  uint32_t line = 0;  ///< 1-based
  SourceRange span;   ///< byte range of the originating syntax node
  bool normalized = false;
  FactData data;

  [[nodiscard]] const ImportFact * as_import() const { return std::get_if<ImportFact>(&data); }
  [[nodiscard]] const DefinitionFact * as_definition() const
  {
    return std::get_if<DefinitionFact>(&data);
  }
  [[nodiscard]] const ReferenceFact * as_reference() const
  {
    return std::get_if<ReferenceFact>(&data);
  }

  [[nodiscard]] ImportFact * as_import() { return std::get_if<ImportFact>(&data); }
  [[nodiscard]] DefinitionFact * as_definition() { return std::get_if<DefinitionFact>(&data); }
  [[nodiscard]] ReferenceFact * as_reference() { return std::get_if<ReferenceFact>(&data); }

  bool operator==(const Fact & o) const
  {
    return file == o.file && line == o.line && span == o.span && normalized == o.normalized &&
           data == o.data;
  }
  bool operator!=(const Fact & o) const { return !(*this == o); }
};

using FactList = std::vector<Fact>;

}  // namespace seiri

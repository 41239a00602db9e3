// seiri/extract/language_adapter.hpp - Capability-based language adapters
//
// A LanguageAdapter is a descriptor: a tree-sitter grammar plus a routine
// that walks the concrete syntax tree and records raw facts. Dispatch by
// file extension goes through AdapterRegistry; new languages are added by
// registering another descriptor.
//
#pragma once

#include <tree_sitter/api.h>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "seiri/basic/language.hpp"
#include "seiri/extract/fact.hpp"
#include "seiri/syntax/ts_ll.hpp"

namespace seiri
{

// ============================================================================
// Extraction Result
// ============================================================================

/**
 * Syntax the grammar could not handle.
 */
struct ParseError
{
  uint32_t line = 0;    ///< 1-based, 0 if unknown
  uint32_t column = 0;  ///< 1-based, 0 if unknown
  std::string message;
  std::string source_line;
};

struct ExtractResult
{
  /// Raw facts in source order (only valid if success == true)
  FactList facts;

  bool success = false;

  /// Set when success == false
  std::optional<ParseError> error;

  static ExtractResult ok(FactList facts)
  {
    ExtractResult r;
    r.facts = std::move(facts);
    r.success = true;
    return r;
  }

  static ExtractResult fail(ParseError err)
  {
    ExtractResult r;
    r.error = std::move(err);
    r.success = false;
    return r;
  }
};

// ============================================================================
// FactCollector
// ============================================================================

/**
 * Sink handed to an adapter's collect routine. Stamps every fact with the
 * originating file, line and byte span of the syntax node it came from.
 */
class FactCollector
{
public:
  FactCollector(std::filesystem::path file, std::string_view source);

  [[nodiscard]] std::string_view source() const noexcept { return source_; }
  [[nodiscard]] std::string_view text(ts_ll::Node n) const noexcept { return n.text(source_); }

  void add_import(
    ts_ll::Node at, std::string module, std::string name = {}, std::string alias = {},
    std::optional<int> level = std::nullopt);

  /// `node` must span the whole definition (its body included)
  void add_definition(
    ts_ll::Node node, DefinitionKind kind, std::string name, std::string container = {});

  void add_reference(ts_ll::Node at, ReferenceKind kind, std::string name);

  /// Facts ordered by start offset (preorder for ties)
  [[nodiscard]] FactList take();

private:
  void push(ts_ll::Node at, FactData data);

  std::filesystem::path file_;
  std::string_view source_;
  FactList facts_;
};

// ============================================================================
// LanguageAdapter
// ============================================================================

using GrammarFn = const TSLanguage * (*)();
using CollectFn = void (*)(ts_ll::Node root, FactCollector & out);

struct LanguageAdapter
{
  Language language = Language::Python;
  std::vector<std::string> extensions;
  GrammarFn grammar = nullptr;
  CollectFn collect = nullptr;

  /**
   * Parse one file's text and collect its raw facts.
   *
   * Holds no cross-file state, so files may be extracted concurrently.
   * A tree containing ERROR or MISSING nodes fails with the position of
   * the first one.
   */
  [[nodiscard]] ExtractResult extract(
    const std::filesystem::path & file, std::string_view source) const;
};

// ============================================================================
// AdapterRegistry
// ============================================================================

class AdapterRegistry
{
public:
  AdapterRegistry() = default;

  /// Registry populated with every bundled adapter
  [[nodiscard]] static AdapterRegistry with_builtin_adapters();

  /// Adds an adapter; its extensions take over any earlier mapping.
  void register_adapter(LanguageAdapter adapter);

  /// Replace the extensions handled by a language's adapter(s).
  void set_extensions(Language lang, const std::vector<std::string> & extensions);

  [[nodiscard]] const LanguageAdapter * find(Language lang) const;
  [[nodiscard]] const LanguageAdapter * find_for_extension(std::string_view ext) const;
  [[nodiscard]] const LanguageAdapter * find_for_path(const std::filesystem::path & path) const;

  [[nodiscard]] const std::vector<LanguageAdapter> & adapters() const { return adapters_; }

private:
  void rebuild_extension_map();

  std::vector<LanguageAdapter> adapters_;
  std::unordered_map<std::string, size_t> by_extension_;
};

/// Lower-cased extension without the leading dot ("" if none)
[[nodiscard]] std::string extension_of(const std::filesystem::path & path);

}  // namespace seiri

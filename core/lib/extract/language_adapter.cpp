// seiri/extract/language_adapter.cpp - Adapter dispatch and fact collection
#include "seiri/extract/language_adapter.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <cctype>
#include <utility>

#include "seiri/extract/adapters.hpp"

namespace seiri
{

// ============================================================================
// FactCollector
// ============================================================================

FactCollector::FactCollector(std::filesystem::path file, std::string_view source)
: file_(std::move(file)), source_(source)
{
}

void FactCollector::push(ts_ll::Node at, FactData data)
{
  Fact f;
  f.file = file_;
  f.line = at.start_line();
  f.span = at.range();
  f.data = std::move(data);
  facts_.push_back(std::move(f));
}

void FactCollector::add_import(
  ts_ll::Node at, std::string module, std::string name, std::string alias, std::optional<int> level)
{
  ImportFact imp;
  imp.module = std::move(module);
  imp.name = std::move(name);
  imp.alias = std::move(alias);
  imp.level = level;
  push(at, std::move(imp));
}

void FactCollector::add_definition(
  ts_ll::Node node, DefinitionKind kind, std::string name, std::string container)
{
  DefinitionFact def;
  def.kind = kind;
  def.name = std::move(name);
  def.container = std::move(container);
  push(node, std::move(def));
}

void FactCollector::add_reference(ts_ll::Node at, ReferenceKind kind, std::string name)
{
  ReferenceFact ref;
  ref.kind = kind;
  ref.name = std::move(name);
  push(at, std::move(ref));
}

FactList FactCollector::take()
{
  std::stable_sort(facts_.begin(), facts_.end(), [](const Fact & a, const Fact & b) {
    return a.span.get_begin() < b.span.get_begin();
  });
  return std::move(facts_);
}

// ============================================================================
// LanguageAdapter
// ============================================================================

ExtractResult LanguageAdapter::extract(
  const std::filesystem::path & file, std::string_view source) const
{
  if (grammar == nullptr || collect == nullptr) {
    return ExtractResult::fail(
      ParseError{0, 0, fmt::format("no grammar available for {}", to_string(language)), {}});
  }

  ts_ll::Parser parser(grammar());
  if (!parser.is_ready()) {
    return ExtractResult::fail(ParseError{
      0, 0, fmt::format("tree-sitter rejected the {} grammar", to_string(language)), {}});
  }

  const ts_ll::Tree tree = parser.parse_string(source);
  const ts_ll::Node root = tree.root_node();
  if (root.is_null()) {
    return ExtractResult::fail(ParseError{0, 0, "parser produced no tree", {}});
  }

  if (root.has_error()) {
    const ts_ll::Node bad = ts_ll::find_first_error(root);
    ParseError err;
    err.line = bad.start_line();
    err.column = bad.start_column();
    err.message = bad.is_missing()
                    ? fmt::format(
                        "syntax error while parsing {} source: missing '{}'", to_string(language),
                        bad.kind())
                    : fmt::format("syntax error while parsing {} source", to_string(language));
    const SourceFile sf(file, std::string(source));
    err.source_line = std::string(sf.get_line(err.line - 1));
    return ExtractResult::fail(std::move(err));
  }

  FactCollector out(file, source);
  collect(root, out);
  return ExtractResult::ok(out.take());
}

// ============================================================================
// AdapterRegistry
// ============================================================================

std::string extension_of(const std::filesystem::path & path)
{
  std::string ext = path.extension().string();
  if (!ext.empty() && ext.front() == '.') {
    ext.erase(0, 1);
  }
  std::transform(ext.begin(), ext.end(), ext.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return ext;
}

AdapterRegistry AdapterRegistry::with_builtin_adapters()
{
  AdapterRegistry reg;
  reg.register_adapter(make_python_adapter());
  reg.register_adapter(make_rust_adapter());
  reg.register_adapter(make_typescript_adapter());
  reg.register_adapter(make_tsx_adapter());
  reg.register_adapter(make_javascript_adapter());
  reg.register_adapter(make_cpp_adapter());
  return reg;
}

void AdapterRegistry::register_adapter(LanguageAdapter adapter)
{
  for (auto & existing : adapters_) {
    if (existing.language == adapter.language) {
      existing = std::move(adapter);
      rebuild_extension_map();
      return;
    }
  }
  adapters_.push_back(std::move(adapter));
  rebuild_extension_map();
}

void AdapterRegistry::set_extensions(Language lang, const std::vector<std::string> & extensions)
{
  for (auto & adapter : adapters_) {
    if (adapter.language == lang) {
      adapter.extensions = extensions;
      continue;
    }
    // An extension belongs to exactly one language
    auto & exts = adapter.extensions;
    exts.erase(
      std::remove_if(
        exts.begin(), exts.end(),
        [&](const std::string & e) {
          return std::find(extensions.begin(), extensions.end(), e) != extensions.end();
        }),
      exts.end());
  }
  rebuild_extension_map();
}

void AdapterRegistry::rebuild_extension_map()
{
  by_extension_.clear();
  for (size_t i = 0; i < adapters_.size(); ++i) {
    for (const auto & ext : adapters_[i].extensions) {
      by_extension_[ext] = i;
    }
  }
}

const LanguageAdapter * AdapterRegistry::find(Language lang) const
{
  for (const auto & adapter : adapters_) {
    if (adapter.language == lang) {
      return &adapter;
    }
  }
  return nullptr;
}

const LanguageAdapter * AdapterRegistry::find_for_extension(std::string_view ext) const
{
  if (auto it = by_extension_.find(std::string(ext)); it != by_extension_.end()) {
    return &adapters_[it->second];
  }
  return nullptr;
}

const LanguageAdapter * AdapterRegistry::find_for_path(const std::filesystem::path & path) const
{
  const std::string ext = extension_of(path);
  if (ext.empty()) {
    return nullptr;
  }
  return find_for_extension(ext);
}

}  // namespace seiri

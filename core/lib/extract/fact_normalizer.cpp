// seiri/extract/fact_normalizer.cpp - Fact normalization
#include "seiri/extract/fact_normalizer.hpp"

#include <fmt/core.h>

#include <utility>

#include "seiri/extract/adapters.hpp"

namespace seiri
{

namespace
{

struct LevelAndModule
{
  int level = 0;
  std::string module;
};

LevelAndModule python_module(std::string_view raw)
{
  LevelAndModule out;
  size_t dots = 0;
  while (dots < raw.size() && raw[dots] == '.') {
    ++dots;
  }
  out.level = static_cast<int>(dots);
  out.module = std::string(raw.substr(dots));
  return out;
}

// crate::a -> 0 "a"; self::a -> 1 "a"; super::super::a -> 3 "a"
LevelAndModule rust_module(std::string_view raw)
{
  LevelAndModule out;
  auto segs = adapter_util::split(raw, "::");
  size_t i = 0;
  if (i < segs.size() && segs[i] == "crate") {
    out.level = 0;
    ++i;
  } else if (i < segs.size() && segs[i] == "self") {
    out.level = 1;
    ++i;
  }
  while (i < segs.size() && segs[i] == "super") {
    out.level = (out.level == 0 ? 1 : out.level) + 1;
    ++i;
  }
  for (; i < segs.size(); ++i) {
    if (segs[i].empty()) {
      continue;
    }
    if (!out.module.empty()) {
      out.module += '.';
    }
    out.module += segs[i];
  }
  return out;
}

// ./a -> 1 "a"; ../../a -> 3 "a"; react -> 0 "react"
LevelAndModule script_module(std::string_view raw)
{
  LevelAndModule out;
  std::string_view rest = raw;
  if (rest == "." || rest.substr(0, 2) == "./") {
    out.level = 1;
    rest.remove_prefix(rest.size() == 1 ? 1 : 2);
  }
  while (rest == ".." || rest.substr(0, 3) == "../") {
    out.level = (out.level == 0 ? 1 : out.level) + 1;
    rest.remove_prefix(rest.size() == 2 ? 2 : 3);
  }
  while (!rest.empty() && rest.back() == '/') {
    rest.remove_suffix(1);
  }
  out.module = std::string(rest);
  return out;
}

// "a.h" -> 1 "a.h"; <vector> -> 0 "vector"
LevelAndModule cpp_module(std::string_view raw)
{
  LevelAndModule out;
  if (raw.size() >= 2 && raw.front() == '<' && raw.back() == '>') {
    out.level = 0;
    out.module = std::string(raw.substr(1, raw.size() - 2));
  } else if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
    out.level = 1;
    out.module = std::string(raw.substr(1, raw.size() - 2));
  } else {
    out.module = std::string(raw);
  }
  return out;
}

}  // namespace

std::string fold_member_separators(std::string_view name)
{
  std::string out;
  out.reserve(name.size());
  for (size_t i = 0; i < name.size(); ++i) {
    if (name.compare(i, 2, "::") == 0 || name.compare(i, 2, "->") == 0) {
      out.push_back('.');
      ++i;
    } else {
      out.push_back(name[i]);
    }
  }
  return out;
}

FactNormalizer::FactNormalizer(Language language, DiagnosticBag * diags)
: language_(language), diags_(diags)
{
}

std::optional<Fact> FactNormalizer::normalize(const Fact & fact)
{
  close_scopes_before(fact);

  if (fact.normalized) {
    if (const auto * def = fact.as_definition()) {
      open_scope(fact, *def);
    }
    return fact;
  }

  if (fact.line == 0) {
    report(fact, "fact has no source line");
    return std::nullopt;
  }

  Fact out = fact;
  bool ok = false;
  if (auto * imp = out.as_import()) {
    ok = normalize_import(*imp);
    if (!ok) {
      report(fact, "import with an empty module name");
    }
  } else if (auto * def = out.as_definition()) {
    ok = normalize_definition(*def);
    if (!ok) {
      report(fact, fmt::format("{} definition without a name", to_string(def->kind)));
    } else {
      open_scope(out, *def);
    }
  } else if (auto * ref = out.as_reference()) {
    ok = normalize_reference(*ref);
    if (!ok) {
      report(fact, fmt::format("{} reference without a name", to_string(ref->kind)));
    }
  }

  if (!ok) {
    return std::nullopt;
  }
  out.normalized = true;
  return out;
}

FactList FactNormalizer::normalize_all(const FactList & facts)
{
  FactList out;
  out.reserve(facts.size());
  for (const auto & f : facts) {
    if (auto n = normalize(f)) {
      out.push_back(std::move(*n));
    }
  }
  reset();
  return out;
}

// ============================================================================
// Scope stack
// ============================================================================

void FactNormalizer::close_scopes_before(const Fact & fact)
{
  const uint32_t start = fact.span.is_valid() ? fact.span.get_begin().get_offset() : 0;
  while (!scopes_.empty() && start >= scopes_.back().end_offset) {
    scopes_.pop_back();
  }
}

void FactNormalizer::open_scope(const Fact & fact, const DefinitionFact & def)
{
  if (!fact.span.is_valid()) {
    return;
  }
  scopes_.push_back({def.qualified_name, def.kind, fact.span.get_end().get_offset()});
}

std::string FactNormalizer::enclosing_container() const
{
  for (auto it = scopes_.rbegin(); it != scopes_.rend(); ++it) {
    if (it->kind == DefinitionKind::Container) {
      return it->qualified_name;
    }
  }
  return {};
}

// ============================================================================
// Per-kind rules
// ============================================================================

bool FactNormalizer::normalize_import(ImportFact & imp) const
{
  LevelAndModule lm;
  switch (language_) {
    case Language::Python:
      lm = python_module(imp.module);
      break;
    case Language::Rust:
      lm = rust_module(imp.module);
      break;
    case Language::TypeScript:
    case Language::Tsx:
    case Language::JavaScript:
      lm = script_module(imp.module);
      break;
    case Language::Cpp:
      lm = cpp_module(imp.module);
      break;
  }

  // A level supplied by the adapter wins when the text carried none
  if (imp.level && lm.level == 0) {
    lm.level = *imp.level;
  }

  imp.module = std::move(lm.module);
  imp.level = lm.level;

  if (!imp.alias.empty() && (imp.alias == imp.name || (imp.name.empty() && imp.alias == imp.module))) {
    imp.alias.clear();
  }

  return !(imp.module.empty() && lm.level == 0);
}

bool FactNormalizer::normalize_definition(DefinitionFact & def) const
{
  if (def.name.empty()) {
    return false;
  }
  def.container = fold_member_separators(def.container);

  std::string qualified = enclosing_container();
  if (!def.container.empty()) {
    qualified = qualified.empty() ? def.container : qualified + "." + def.container;
  }
  def.qualified_name = qualified.empty() ? def.name : qualified + "." + def.name;
  return true;
}

bool FactNormalizer::normalize_reference(ReferenceFact & ref) const
{
  if (ref.name.empty()) {
    return false;
  }
  ref.name = fold_member_separators(ref.name);
  ref.scope = scopes_.empty() ? std::string() : scopes_.back().qualified_name;
  return true;
}

void FactNormalizer::report(const Fact & fact, std::string message)
{
  if (diags_ == nullptr) {
    return;
  }
  diags_->report_warning(DiagnosticKind::MalformedFact, fact.file, std::move(message))
    .at({fact.line, 1});
}

}  // namespace seiri

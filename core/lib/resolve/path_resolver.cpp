// seiri/resolve/path_resolver.cpp - Import resolution
#include "seiri/resolve/path_resolver.hpp"

#include <algorithm>
#include <filesystem>
#include <tuple>

#include "seiri/extract/adapters.hpp"

namespace seiri
{

namespace
{

std::string join_path(const std::string & a, const std::string & b)
{
  if (a.empty()) return b;
  if (b.empty()) return a;
  return a + "/" + b;
}

/// Collapse `.`/`..` segments; nullopt if the path leaves the root
std::optional<std::string> normalize_relative(const std::string & rel)
{
  if (rel.empty()) {
    return rel;
  }
  std::string out = std::filesystem::path(rel).lexically_normal().generic_string();
  if (out == ".") {
    return std::string();
  }
  if (out == ".." || out.rfind("../", 0) == 0) {
    return std::nullopt;
  }
  while (!out.empty() && out.back() == '/') {
    out.pop_back();
  }
  return out;
}

bool key_matches(const std::string & key, const std::string & name, char sep)
{
  if (key == name) {
    return true;
  }
  if (key.size() <= name.size()) {
    return false;
  }
  // Suffix match only on a segment boundary
  return key[key.size() - name.size() - 1] == sep &&
         key.compare(key.size() - name.size(), name.size(), name) == 0;
}

bool has_script_extension(const std::string & s)
{
  for (const auto * ext : {".js", ".jsx", ".mjs", ".cjs", ".ts", ".tsx", ".mts", ".cts"}) {
    const std::string e(ext);
    if (s.size() > e.size() && s.compare(s.size() - e.size(), e.size(), e) == 0) {
      return true;
    }
  }
  return false;
}

}  // namespace

std::vector<std::string> lookup_names(const ImportFact & imp, Language lang)
{
  std::vector<std::string> out;
  if (module_style(lang) == ModuleStyle::Path) {
    out.push_back(imp.module);
    if (has_script_extension(imp.module)) {
      out.push_back(imp.module.substr(0, imp.module.rfind('.')));
    }
    return out;
  }

  // Dotted: `from a.b import c` tries a.b.c, a.b, a
  std::string full = imp.module;
  if (!imp.name.empty() && imp.name != "*") {
    full = full.empty() ? imp.name : full + "." + imp.name;
  }
  auto segs = adapter_util::split(full, ".");
  while (!segs.empty()) {
    std::string name;
    for (const auto & s : segs) {
      name = name.empty() ? s : name + "." + s;
    }
    out.push_back(std::move(name));
    segs.pop_back();
  }
  if (imp.module.empty()) {
    // `from . import x` may also name the package itself
    out.emplace_back();
  }
  return out;
}

size_t directory_distance(const std::string & from_dir, const std::string & to_dir)
{
  const auto a = from_dir.empty() ? std::vector<std::string>{} : adapter_util::split(from_dir, "/");
  const auto b = to_dir.empty() ? std::vector<std::string>{} : adapter_util::split(to_dir, "/");
  size_t common = 0;
  while (common < a.size() && common < b.size() && a[common] == b[common]) {
    ++common;
  }
  return (a.size() - common) + (b.size() - common);
}

Resolution PathResolver::resolve(const ImportFact & imp, size_t importer) const
{
  const IndexedFile & from = index_.file(importer);
  const int level = imp.level.value_or(0);
  const auto lookups = lookup_names(imp, from.language);

  std::optional<size_t> hit;
  if (level > 0) {
    hit = resolve_relative(lookups, level, from);
  }
  if (!hit) {
    hit = resolve_absolute(lookups, from);
  }

  if (hit) {
    return *hit == importer ? Resolution::self_import(importer) : Resolution::to_file(*hit);
  }

  if (!imp.module.empty()) {
    return Resolution::to_external(imp.module);
  }
  if (!imp.name.empty()) {
    return Resolution::to_external(imp.name);
  }
  return Resolution::to_external(std::string(static_cast<size_t>(std::max(level, 1)), '.'));
}

std::vector<Resolution> PathResolver::resolve_file(const FactList & facts, size_t importer) const
{
  std::vector<Resolution> out;
  for (const auto & f : facts) {
    if (const auto * imp = f.as_import()) {
      out.push_back(resolve(*imp, importer));
    }
  }
  return out;
}

std::optional<size_t> PathResolver::resolve_relative(
  const std::vector<std::string> & lookups, int level, const IndexedFile & from) const
{
  std::string dir = from.directory();
  for (int i = 1; i < level; ++i) {
    if (dir.empty()) {
      return std::nullopt;  // walked above the project root
    }
    const auto slash = dir.rfind('/');
    dir = slash == std::string::npos ? std::string() : dir.substr(0, slash);
  }

  const char sep = module_separator(from.language);
  for (const auto & name : lookups) {
    std::string rel = name;
    if (sep != '/') {
      std::replace(rel.begin(), rel.end(), sep, '/');
    }
    const auto base = normalize_relative(join_path(dir, rel));
    if (!base) {
      continue;
    }
    for (const auto & candidate : candidate_files(*base, from.language)) {
      if (auto idx = index_.find_relative(candidate)) {
        if (same_family(from.language, index_.file(*idx).language)) {
          return idx;
        }
      }
    }
  }
  return std::nullopt;
}

std::optional<size_t> PathResolver::resolve_absolute(
  const std::vector<std::string> & lookups, const IndexedFile & from) const
{
  const char sep = module_separator(from.language);
  const std::string from_dir = from.directory();

  for (const auto & name : lookups) {
    if (name.empty()) {
      continue;
    }

    std::optional<size_t> best;
    std::tuple<size_t, std::string> best_rank;
    for (size_t i = 0; i < index_.size(); ++i) {
      const IndexedFile & f = index_.file(i);
      if (!same_family(from.language, f.language)) {
        continue;
      }
      const bool matched = std::any_of(
        f.module_keys.begin(), f.module_keys.end(),
        [&](const std::string & key) { return key_matches(key, name, sep); });
      if (!matched) {
        continue;
      }
      auto rank = std::make_tuple(directory_distance(from_dir, f.directory()), f.relative);
      if (!best || rank < best_rank) {
        best = i;
        best_rank = std::move(rank);
      }
    }
    if (best) {
      return best;
    }
  }
  return std::nullopt;
}

std::vector<std::string> PathResolver::candidate_files(const std::string & base, Language lang) const
{
  std::vector<std::string> out;
  switch (lang) {
    case Language::Python:
      if (!base.empty()) {
        out.push_back(base + ".py");
        out.push_back(base + ".pyi");
      }
      out.push_back(join_path(base, "__init__.py"));
      break;
    case Language::Rust:
      if (!base.empty()) {
        out.push_back(base + ".rs");
      }
      out.push_back(join_path(base, "mod.rs"));
      break;
    case Language::TypeScript:
    case Language::Tsx:
    case Language::JavaScript: {
      static const char * const k_exts[] = {"ts", "tsx", "mts", "cts", "js", "jsx", "mjs", "cjs"};
      if (!base.empty()) {
        out.push_back(base);
        for (const auto * ext : k_exts) {
          out.push_back(base + "." + ext);
        }
      }
      for (const auto * ext : k_exts) {
        out.push_back(join_path(base, std::string("index.") + ext));
      }
      break;
    }
    case Language::Cpp:
      if (!base.empty()) {
        out.push_back(base);
        for (const auto * ext : {".h", ".hpp", ".hh", ".hxx"}) {
          out.push_back(base + ext);
        }
      }
      break;
  }
  return out;
}

}  // namespace seiri

// seiri/resolve/file_index.cpp - File index and module keys
#include "seiri/resolve/file_index.hpp"

#include <algorithm>

#include "seiri/extract/adapters.hpp"

namespace seiri
{

namespace fs = std::filesystem;

namespace
{

std::string join(const std::vector<std::string> & segs, size_t from, size_t to, char sep)
{
  std::string out;
  for (size_t i = from; i < to; ++i) {
    if (!out.empty()) {
      out.push_back(sep);
    }
    out += segs[i];
  }
  return out;
}

std::string strip_extension(std::string_view relative)
{
  const auto slash = relative.rfind('/');
  const auto dot = relative.rfind('.');
  if (dot == std::string_view::npos || (slash != std::string_view::npos && dot < slash) ||
      dot == (slash == std::string_view::npos ? 0 : slash + 1)) {
    return std::string(relative);
  }
  return std::string(relative.substr(0, dot));
}

void add_key(std::vector<std::string> & keys, std::string key)
{
  if (!key.empty() && std::find(keys.begin(), keys.end(), key) == keys.end()) {
    keys.push_back(std::move(key));
  }
}

}  // namespace

std::vector<std::string> module_keys_for(std::string_view relative, Language language)
{
  std::vector<std::string> keys;
  auto segs = adapter_util::split(strip_extension(relative), "/");

  switch (language) {
    case Language::Python: {
      if (!segs.empty() && segs.back() == "__init__") {
        segs.pop_back();
      }
      add_key(keys, join(segs, 0, segs.size(), '.'));
      if (segs.size() > 1 && segs.front() == "src") {
        add_key(keys, join(segs, 1, segs.size(), '.'));
      }
      break;
    }
    case Language::Rust: {
      // Module paths start below the crate's src/ directory
      const auto src = std::find(segs.begin(), segs.end(), "src");
      const size_t from = src == segs.end() ? 0 : static_cast<size_t>(src - segs.begin()) + 1;
      size_t to = segs.size();
      if (to > from && segs[to - 1] == "mod") {
        --to;
      }
      if (to == from + 1 && (segs[from] == "main" || segs[from] == "lib")) {
        break;
      }
      add_key(keys, join(segs, from, to, '.'));
      break;
    }
    case Language::TypeScript:
    case Language::Tsx:
    case Language::JavaScript: {
      if (!segs.empty() && segs.back() == "index") {
        segs.pop_back();
      }
      add_key(keys, join(segs, 0, segs.size(), '/'));
      if (segs.size() > 1 && segs.front() == "src") {
        add_key(keys, join(segs, 1, segs.size(), '/'));
      }
      break;
    }
    case Language::Cpp:
      add_key(keys, std::string(relative));
      break;
  }
  return keys;
}

fs::path common_root(const std::vector<fs::path> & paths)
{
  if (paths.empty()) {
    return {};
  }

  fs::path prefix = fs::absolute(paths.front()).lexically_normal().parent_path();
  for (size_t i = 1; i < paths.size(); ++i) {
    const fs::path dir = fs::absolute(paths[i]).lexically_normal().parent_path();
    fs::path common;
    auto a = prefix.begin();
    auto b = dir.begin();
    for (; a != prefix.end() && b != dir.end() && *a == *b; ++a, ++b) {
      common /= *a;
    }
    prefix = common;
  }
  return prefix;
}

std::string IndexedFile::directory() const
{
  const auto slash = relative.rfind('/');
  return slash == std::string::npos ? std::string() : relative.substr(0, slash);
}

FileIndex::FileIndex(
  const std::vector<DiscoveredFile> & files, const std::optional<fs::path> & root)
{
  if (root) {
    root_ = fs::absolute(*root).lexically_normal();
  } else {
    std::vector<fs::path> paths;
    paths.reserve(files.size());
    for (const auto & f : files) {
      paths.push_back(f.path);
    }
    root_ = common_root(paths);
  }
  // lexically_normal() keeps a trailing separator on directories
  if (root_.has_relative_path() && root_.filename().empty()) {
    root_ = root_.parent_path();
  }

  files_.reserve(files.size());
  for (const auto & f : files) {
    IndexedFile entry;
    entry.path = f.path;
    entry.language = f.language;
    const fs::path abs = fs::absolute(f.path).lexically_normal();
    const fs::path rel = abs.lexically_relative(root_);
    entry.relative = rel.empty() ? abs.generic_string() : rel.generic_string();
    entry.module_keys = module_keys_for(entry.relative, entry.language);

    by_relative_.emplace(entry.relative, files_.size());
    files_.push_back(std::move(entry));
  }
}

std::optional<size_t> FileIndex::find_relative(std::string_view relative) const
{
  if (auto it = by_relative_.find(std::string(relative)); it != by_relative_.end()) {
    return it->second;
  }
  return std::nullopt;
}

}  // namespace seiri

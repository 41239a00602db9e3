// seiri/driver/workspace.cpp - Incremental analysis workspace
//
#include "seiri/driver/workspace.hpp"

#include <map>

namespace seiri
{

// =============================================================================
// Workspace::Impl
// =============================================================================

struct Workspace::Impl
{
  struct Entry
  {
    std::filesystem::path path;
    Language language = Language::Python;
    std::string content;
    bool extracted = false;
    FileExtraction extraction;
  };

  AnalyzeOptions options;
  AdapterRegistry registry;

  /// Keyed by generic path string, which is also the discovery order
  std::map<std::string, Entry> files;

  size_t extractions = 0;

  static std::string key_of(const std::filesystem::path & path)
  {
    return path.lexically_normal().generic_string();
  }

  const Entry * get(const std::filesystem::path & path) const
  {
    auto it = files.find(key_of(path));
    if (it == files.end()) {
      return nullptr;
    }
    return &it->second;
  }
};

// =============================================================================
// Workspace public API
// =============================================================================

Workspace::Workspace(AnalyzeOptions options) : impl_(new Impl())
{
  impl_->registry = options.make_registry();
  impl_->options = std::move(options);
}

Workspace::~Workspace() { delete impl_; }

Workspace::Workspace(Workspace && other) noexcept : impl_(other.impl_) { other.impl_ = nullptr; }

Workspace & Workspace::operator=(Workspace && other) noexcept
{
  if (this == &other) {
    return *this;
  }
  delete impl_;
  impl_ = other.impl_;
  other.impl_ = nullptr;
  return *this;
}

bool Workspace::set_file(const std::filesystem::path & path, std::string content)
{
  const auto * adapter = impl_->registry.find_for_path(path);
  if (!adapter) {
    return false;
  }
  return set_file(path, adapter->language, std::move(content));
}

bool Workspace::set_file(
  const std::filesystem::path & path, Language language, std::string content)
{
  const auto * adapter = impl_->registry.find(language);
  if (!adapter) {
    return false;
  }

  auto & entry = impl_->files[Impl::key_of(path)];
  if (entry.extracted && entry.language == language && entry.content == content) {
    return false;
  }

  entry.path = path;
  entry.language = language;
  entry.extraction = extract_file(*adapter, path, content);
  entry.content = std::move(content);
  entry.extracted = true;
  ++impl_->extractions;
  return true;
}

bool Workspace::remove_file(const std::filesystem::path & path)
{
  return impl_->files.erase(Impl::key_of(path)) > 0;
}

bool Workspace::has_file(const std::filesystem::path & path) const
{
  return impl_->get(path) != nullptr;
}

size_t Workspace::file_count() const { return impl_->files.size(); }

size_t Workspace::extraction_count() const { return impl_->extractions; }

std::optional<FactList> Workspace::facts(const std::filesystem::path & path) const
{
  const auto * entry = impl_->get(path);
  if (!entry) {
    return std::nullopt;
  }
  return entry->extraction.facts;
}

AnalyzeResult Workspace::build() const
{
  std::vector<DiscoveredFile> files;
  std::vector<FileExtraction> extractions;
  files.reserve(impl_->files.size());
  extractions.reserve(impl_->files.size());
  for (const auto & [key, entry] : impl_->files) {
    files.push_back({entry.path, entry.language});
    extractions.push_back(entry.extraction);
  }
  return Analyzer::link(files, std::move(extractions), impl_->options);
}

}  // namespace seiri

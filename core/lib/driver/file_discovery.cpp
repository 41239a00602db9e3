// seiri/driver/file_discovery.cpp - Project file discovery
//
#include "seiri/driver/file_discovery.hpp"

#include <algorithm>

namespace fs = std::filesystem;

namespace seiri
{

namespace
{

bool is_hidden(const fs::path & p)
{
  const std::string name = p.filename().string();
  return name.size() > 1 && name.front() == '.';
}

bool is_excluded(const fs::path & p, const std::vector<std::string> & exclude)
{
  const std::string name = p.filename().string();
  return std::find(exclude.begin(), exclude.end(), name) != exclude.end();
}

void consider(
  const fs::path & path, const AdapterRegistry & registry, const DiscoveryOptions & options,
  DiscoveryResult & out)
{
  if (const auto * adapter = registry.find_for_path(path)) {
    out.files.push_back({path, adapter->language});
  } else if (options.report_unsupported) {
    out.diagnostics.report_info(
      DiagnosticKind::UnsupportedLanguage, path, "no language adapter for this file; skipped");
  }
}

}  // namespace

DiscoveryResult discover_files(
  const fs::path & root, const AdapterRegistry & registry, const DiscoveryOptions & options)
{
  DiscoveryResult result;
  std::error_code ec;

  if (!fs::exists(root, ec)) {
    result.error = "path not found: " + root.string();
    return result;
  }

  if (fs::is_regular_file(root, ec)) {
    consider(root, registry, options, result);
    result.success = true;
    return result;
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    result.error = "cannot read directory " + root.string() + ": " + ec.message();
    return result;
  }

  const fs::recursive_directory_iterator end;
  while (it != end) {
    const fs::path path = it->path();
    if (it->is_directory(ec)) {
      if (is_hidden(path) || is_excluded(path, options.exclude)) {
        it.disable_recursion_pending();
      } else if (fs::directory_iterator listing(path, ec); ec) {
        // Unreadable subdirectories are skipped; the walk goes on
        result.diagnostics.report_warning(
          DiagnosticKind::Io, path, "cannot read directory; skipped: " + ec.message());
        it.disable_recursion_pending();
      }
    } else if (
      !is_hidden(path) && !is_excluded(path, options.exclude) && it->is_regular_file(ec)) {
      consider(path, registry, options, result);
    }
    ec.clear();

    it.increment(ec);
    if (ec) {
      // A failed increment leaves the iterator unusable
      result.diagnostics.report_warning(
        DiagnosticKind::Io, path, "directory walk stopped here: " + ec.message());
      break;
    }
  }

  std::sort(result.files.begin(), result.files.end(), [](const auto & a, const auto & b) {
    return a.path.generic_string() < b.path.generic_string();
  });
  result.success = true;
  return result;
}

}  // namespace seiri

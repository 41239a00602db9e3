// tests/unit/driver/test_file_discovery.cpp - Project file discovery

#include <gtest/gtest.h>
#include <unistd.h>

#include <filesystem>

#include <string>
#include <vector>

#include "seiri/driver/file_discovery.hpp"
#include "seiri/test_support/temp_project.hpp"

using namespace seiri;
using seiri::test_support::TempProject;

namespace
{

std::vector<std::string> relative_paths(const DiscoveryResult & r, const TempProject & tmp)
{
  std::vector<std::string> out;
  for (const auto & f : r.files) {
    out.push_back(f.path.lexically_relative(tmp.root()).generic_string());
  }
  return out;
}

DiscoveryOptions default_options()
{
  DiscoveryOptions o;
  o.exclude = {"build", "target", "node_modules", ".git"};
  return o;
}

}  // namespace

TEST(FileDiscovery, SelectsSupportedFilesInPathOrder)
{
  TempProject tmp("seiri_discovery");
  tmp.write("zeta.ts", "export const z = 1;\n");
  tmp.write("a.py", "x = 1\n");
  tmp.write("b/c.rs", "fn main() {}\n");
  tmp.write("README.md", "# readme\n");
  tmp.write(".hidden/x.py", "x = 1\n");
  tmp.write("build/gen.py", "x = 1\n");
  tmp.write("node_modules/dep/index.js", "module.exports = 1;\n");

  const auto registry = AdapterRegistry::with_builtin_adapters();
  const auto r = discover_files(tmp.root(), registry, default_options());
  ASSERT_TRUE(r.success) << r.error;

  EXPECT_EQ(relative_paths(r, tmp), (std::vector<std::string>{"a.py", "b/c.rs", "zeta.ts"}));
  EXPECT_EQ(r.files[0].language, Language::Python);
  EXPECT_EQ(r.files[1].language, Language::Rust);
  EXPECT_EQ(r.files[2].language, Language::TypeScript);
  EXPECT_TRUE(r.diagnostics.empty());
}

TEST(FileDiscovery, ReportsUnsupportedFilesOnRequest)
{
  TempProject tmp("seiri_discovery_unsupported");
  tmp.write("a.py", "x = 1\n");
  tmp.write("notes.txt", "hello\n");

  auto options = default_options();
  options.report_unsupported = true;
  const auto r = discover_files(tmp.root(), AdapterRegistry::with_builtin_adapters(), options);
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.files.size(), 1U);
  ASSERT_EQ(r.diagnostics.size(), 1U);
  const auto & d = *r.diagnostics.begin();
  EXPECT_EQ(d.kind, DiagnosticKind::UnsupportedLanguage);
  EXPECT_EQ(d.severity, Severity::Info);
  EXPECT_EQ(d.file.filename().string(), "notes.txt");
}

TEST(FileDiscovery, CustomExcludes)
{
  TempProject tmp("seiri_discovery_exclude");
  tmp.write("src/a.py", "x = 1\n");
  tmp.write("vendor/b.py", "x = 1\n");
  tmp.write("build/c.py", "x = 1\n");

  DiscoveryOptions options;
  options.exclude = {"vendor"};
  const auto r = discover_files(tmp.root(), AdapterRegistry::with_builtin_adapters(), options);
  EXPECT_EQ(relative_paths(r, tmp), (std::vector<std::string>{"build/c.py", "src/a.py"}));
}

TEST(FileDiscovery, UnreadableSubdirectoryDoesNotStopTheWalk)
{
  if (geteuid() == 0) {
    GTEST_SKIP() << "permission bits are not enforced for root";
  }

  TempProject tmp("seiri_discovery_locked");
  tmp.write("a_locked/m.py", "x = 1\n");
  tmp.write("b/m.py", "x = 1\n");
  tmp.write("c/m.py", "x = 1\n");
  tmp.write("z.py", "x = 1\n");

  const auto locked = tmp.path("a_locked");
  std::filesystem::permissions(locked, std::filesystem::perms::none);
  const auto r = discover_files(tmp.root(), AdapterRegistry::with_builtin_adapters());
  std::filesystem::permissions(locked, std::filesystem::perms::owner_all);

  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(relative_paths(r, tmp), (std::vector<std::string>{"b/m.py", "c/m.py", "z.py"}));
  ASSERT_EQ(r.diagnostics.size(), 1U);
  const auto & d = *r.diagnostics.begin();
  EXPECT_EQ(d.kind, DiagnosticKind::Io);
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.file.filename().string(), "a_locked");
}

TEST(FileDiscovery, SingleFileRoot)
{
  TempProject tmp("seiri_discovery_single");
  const auto file = tmp.write("only.cpp", "int main() { return 0; }\n");

  const auto r = discover_files(file, AdapterRegistry::with_builtin_adapters());
  ASSERT_TRUE(r.success);
  ASSERT_EQ(r.files.size(), 1U);
  EXPECT_EQ(r.files[0].language, Language::Cpp);
}

TEST(FileDiscovery, MissingRootFails)
{
  TempProject tmp("seiri_discovery_missing");
  const auto r = discover_files(tmp.path("nope"), AdapterRegistry::with_builtin_adapters());
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("path not found"), std::string::npos);
  EXPECT_TRUE(r.files.empty());
}

TEST(FileDiscovery, ExtensionOverridesApply)
{
  TempProject tmp("seiri_discovery_override");
  tmp.write("a.py", "x = 1\n");
  tmp.write("b.pyx", "x = 1\n");

  auto registry = AdapterRegistry::with_builtin_adapters();
  registry.set_extensions(Language::Python, {"pyx"});
  const auto r = discover_files(tmp.root(), registry);
  EXPECT_EQ(relative_paths(r, tmp), (std::vector<std::string>{"b.pyx"}));
}

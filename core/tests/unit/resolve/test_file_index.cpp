// tests/unit/resolve/test_file_index.cpp - File index and module keys

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "seiri/resolve/file_index.hpp"

using namespace seiri;

namespace
{

using Keys = std::vector<std::string>;

}  // namespace

TEST(ModuleKeys, Python)
{
  EXPECT_EQ(module_keys_for("pkg/mod.py", Language::Python), (Keys{"pkg.mod"}));
  EXPECT_EQ(module_keys_for("pkg/__init__.py", Language::Python), (Keys{"pkg"}));
  EXPECT_EQ(module_keys_for("src/pkg/mod.py", Language::Python), (Keys{"src.pkg.mod", "pkg.mod"}));
}

TEST(ModuleKeys, Rust)
{
  EXPECT_EQ(module_keys_for("src/net/tcp.rs", Language::Rust), (Keys{"net.tcp"}));
  EXPECT_EQ(module_keys_for("crates/core/src/net/mod.rs", Language::Rust), (Keys{"net"}));
  EXPECT_TRUE(module_keys_for("src/main.rs", Language::Rust).empty());
  EXPECT_TRUE(module_keys_for("src/lib.rs", Language::Rust).empty());
}

TEST(ModuleKeys, Script)
{
  EXPECT_EQ(module_keys_for("src/ui/index.ts", Language::TypeScript), (Keys{"src/ui", "ui"}));
  EXPECT_EQ(module_keys_for("lib/a.js", Language::JavaScript), (Keys{"lib/a"}));
}

TEST(ModuleKeys, CppKeepsTheWholePath)
{
  EXPECT_EQ(module_keys_for("include/net/socket.h", Language::Cpp), (Keys{"include/net/socket.h"}));
}

TEST(FileIndex, RelativePathsAgainstExplicitRoot)
{
  const FileIndex index(
    {{"/proj/app/main.py", Language::Python}, {"/proj/lib/util.rs", Language::Rust}}, "/proj");

  EXPECT_EQ(index.root().generic_string(), "/proj");
  ASSERT_EQ(index.size(), 2U);
  EXPECT_EQ(index.file(0).relative, "app/main.py");
  EXPECT_EQ(index.file(0).directory(), "app");
  EXPECT_EQ(index.file(1).relative, "lib/util.rs");
  EXPECT_EQ(index.file(1).language, Language::Rust);

  const auto util = index.find_relative("lib/util.rs");
  ASSERT_TRUE(util.has_value());
  EXPECT_EQ(*util, 1U);
  EXPECT_FALSE(index.find_relative("lib/missing.rs").has_value());
}

TEST(FileIndex, DefaultRootIsCommonAncestor)
{
  const FileIndex index(
    {{"/proj/a/x.py", Language::Python}, {"/proj/a/b/y.py", Language::Python}});

  EXPECT_EQ(index.root().generic_string(), "/proj/a");
  EXPECT_EQ(index.file(0).relative, "x.py");
  EXPECT_EQ(index.file(0).directory(), "");
  EXPECT_EQ(index.file(1).relative, "b/y.py");
}

TEST(FileIndex, EmptyIndex)
{
  const FileIndex index;
  EXPECT_TRUE(index.empty());
  EXPECT_TRUE(index.files().empty());
}

TEST(FileIndex, CommonRoot)
{
  EXPECT_EQ(common_root({"/p/a/x.py", "/p/b/y.py"}).generic_string(), "/p");
  EXPECT_EQ(common_root({"/p/a/x.py"}).generic_string(), "/p/a");
  EXPECT_TRUE(common_root({}).empty());
}

// tests/unit/extract/test_python_adapter.cpp - Python extraction + normalization

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "seiri/extract/adapters.hpp"
#include "seiri/test_support/extract_helpers.hpp"

using namespace seiri;
using namespace seiri::test_support;

namespace
{

FileExtraction run(const std::string & src) { return extract(make_python_adapter(), "pkg/mod.py", src); }

}  // namespace

TEST(PythonAdapter, ImportStatements)
{
  const auto r = run(
    "import os\n"
    "import os.path as p\n"
    "from .sibling import helper as h, other\n"
    "from ..parent.mod import thing\n"
    "from pkg import *\n");
  ASSERT_FALSE(r.parse_failed);

  const auto imps = imports_of(r.facts);
  ASSERT_EQ(imps.size(), 6U);

  const auto * os = find_import(imps, "os");
  ASSERT_NE(os, nullptr);
  EXPECT_EQ(os->level, 0);
  EXPECT_TRUE(os->alias.empty());

  const auto * path = find_import(imps, "os.path");
  ASSERT_NE(path, nullptr);
  EXPECT_EQ(path->alias, "p");

  const auto * helper = find_import(imps, "sibling", "helper");
  ASSERT_NE(helper, nullptr);
  EXPECT_EQ(helper->level, 1);
  EXPECT_EQ(helper->alias, "h");

  const auto * other = find_import(imps, "sibling", "other");
  ASSERT_NE(other, nullptr);
  EXPECT_TRUE(other->alias.empty());

  const auto * thing = find_import(imps, "parent.mod", "thing");
  ASSERT_NE(thing, nullptr);
  EXPECT_EQ(thing->level, 2);

  const auto * star = find_import(imps, "pkg");
  ASSERT_NE(star, nullptr);
  EXPECT_TRUE(star->name.empty());
}

TEST(PythonAdapter, DotOnlyRelativeImport)
{
  const auto r = run("from . import sibling\n");
  const auto imps = imports_of(r.facts);
  ASSERT_EQ(imps.size(), 1U);
  EXPECT_EQ(imps[0].module, "");
  EXPECT_EQ(imps[0].name, "sibling");
  EXPECT_EQ(imps[0].level, 1);
}

TEST(PythonAdapter, ClassesMethodsAndQualifiedNames)
{
  const auto r = run(
    "class Outer:\n"
    "    class Inner:\n"
    "        def method(self):\n"
    "            return 1\n"
    "    def run(self):\n"
    "        self.method()\n"
    "\n"
    "def top():\n"
    "    pass\n");
  ASSERT_FALSE(r.parse_failed);

  EXPECT_EQ(
    qualified_names(r.facts, DefinitionKind::Container),
    (std::vector<std::string>{"Outer", "Outer.Inner"}));
  EXPECT_EQ(
    qualified_names(r.facts, DefinitionKind::Function),
    (std::vector<std::string>{"Outer.Inner.method", "Outer.run", "top"}));

  EXPECT_TRUE(has_reference(r.facts, ReferenceKind::FunctionCall, "self.method", "Outer.run"));
}

TEST(PythonAdapter, NestedFunctionsAreNotRecorded)
{
  const auto r = run(
    "def outer():\n"
    "    def inner():\n"
    "        pass\n"
    "    inner()\n");

  EXPECT_EQ(
    qualified_names(r.facts, DefinitionKind::Function), (std::vector<std::string>{"outer"}));
  EXPECT_TRUE(has_reference(r.facts, ReferenceKind::FunctionCall, "inner", "outer"));
}

TEST(PythonAdapter, BaseClassesAreContainerUses)
{
  const auto r = run(
    "class Child(Base, mixins.Loggable):\n"
    "    pass\n");

  EXPECT_TRUE(has_reference(r.facts, ReferenceKind::ContainerUse, "Base", "Child"));
  EXPECT_TRUE(has_reference(r.facts, ReferenceKind::ContainerUse, "mixins.Loggable", "Child"));
}

TEST(PythonAdapter, CallsOutsideDefinitionsHaveEmptyScope)
{
  const auto r = run(
    "import util\n"
    "util.helper(1)\n");
  EXPECT_TRUE(has_reference(r.facts, ReferenceKind::FunctionCall, "util.helper", ""));
}

TEST(PythonAdapter, FactsCarryFileAndLine)
{
  const auto r = run(
    "\n"
    "def f():\n"
    "    g()\n");
  ASSERT_EQ(r.facts.size(), 2U);
  EXPECT_EQ(r.facts[0].file, std::filesystem::path("pkg/mod.py"));
  EXPECT_EQ(r.facts[0].line, 2U);
  EXPECT_EQ(r.facts[1].line, 3U);
  for (const auto & f : r.facts) {
    EXPECT_TRUE(f.normalized);
  }
}

TEST(PythonAdapter, SyntaxErrorIsParseFailure)
{
  const auto r = run(
    "def ok():\n"
    "    pass\n"
    "def broken(:\n");
  EXPECT_TRUE(r.parse_failed);
  EXPECT_TRUE(r.facts.empty());
  EXPECT_EQ(r.loc, 3U);

  ASSERT_EQ(r.diagnostics.size(), 1U);
  const auto & d = r.diagnostics.all().front();
  EXPECT_EQ(d.kind, DiagnosticKind::ParseFailure);
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.file, std::filesystem::path("pkg/mod.py"));
  EXPECT_TRUE(d.position.is_valid());
}

TEST(PythonAdapter, ExtractionIsDeterministic)
{
  const std::string src =
    "from .a import b\n"
    "class C(b.Base):\n"
    "    def m(self):\n"
    "        return b.f()\n";
  const auto first = run(src);
  const auto second = run(src);
  EXPECT_EQ(first.facts, second.facts);
}

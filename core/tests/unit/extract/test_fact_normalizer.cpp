// tests/unit/extract/test_fact_normalizer.cpp - Raw fact normalization

#include <gtest/gtest.h>

#include <string>

#include "seiri/extract/fact_normalizer.hpp"

using namespace seiri;

namespace
{

Fact make_fact(FactData data, uint32_t line, uint32_t begin, uint32_t end)
{
  Fact f;
  f.file = "src/x";
  f.line = line;
  f.span = SourceRange(begin, end);
  f.data = std::move(data);
  return f;
}

Fact import_fact(std::string module, std::string name = {}, std::string alias = {})
{
  ImportFact imp;
  imp.module = std::move(module);
  imp.name = std::move(name);
  imp.alias = std::move(alias);
  return make_fact(imp, 1, 0, 10);
}

Fact def_fact(DefinitionKind kind, std::string name, uint32_t begin, uint32_t end)
{
  DefinitionFact def;
  def.kind = kind;
  def.name = std::move(name);
  return make_fact(def, 1, begin, end);
}

Fact ref_fact(std::string name, uint32_t begin)
{
  ReferenceFact ref;
  ref.name = std::move(name);
  return make_fact(ref, 1, begin, begin + 1);
}

ImportFact normalized_import(Language lang, const Fact & raw)
{
  FactNormalizer norm(lang);
  const auto out = norm.normalize(raw);
  EXPECT_TRUE(out.has_value());
  return out ? *out->as_import() : ImportFact{};
}

}  // namespace

TEST(FactNormalizer, PythonLevels)
{
  auto imp = normalized_import(Language::Python, import_fact("os.path"));
  EXPECT_EQ(imp.module, "os.path");
  EXPECT_EQ(imp.level, 0);

  imp = normalized_import(Language::Python, import_fact(".sibling", "f"));
  EXPECT_EQ(imp.module, "sibling");
  EXPECT_EQ(imp.level, 1);

  // from .. import x
  imp = normalized_import(Language::Python, import_fact("..", "x"));
  EXPECT_EQ(imp.module, "");
  EXPECT_EQ(imp.level, 2);
}

TEST(FactNormalizer, RustLevels)
{
  auto imp = normalized_import(Language::Rust, import_fact("crate::net::tcp"));
  EXPECT_EQ(imp.module, "net.tcp");
  EXPECT_EQ(imp.level, 0);

  imp = normalized_import(Language::Rust, import_fact("self::util"));
  EXPECT_EQ(imp.module, "util");
  EXPECT_EQ(imp.level, 1);

  imp = normalized_import(Language::Rust, import_fact("super::super::a"));
  EXPECT_EQ(imp.module, "a");
  EXPECT_EQ(imp.level, 3);
}

TEST(FactNormalizer, ScriptLevels)
{
  auto imp = normalized_import(Language::TypeScript, import_fact("./util"));
  EXPECT_EQ(imp.module, "util");
  EXPECT_EQ(imp.level, 1);

  imp = normalized_import(Language::JavaScript, import_fact("../../lib/a/"));
  EXPECT_EQ(imp.module, "lib/a");
  EXPECT_EQ(imp.level, 3);

  imp = normalized_import(Language::Tsx, import_fact("react"));
  EXPECT_EQ(imp.module, "react");
  EXPECT_EQ(imp.level, 0);
}

TEST(FactNormalizer, CppLevels)
{
  auto imp = normalized_import(Language::Cpp, import_fact("<memory>"));
  EXPECT_EQ(imp.module, "memory");
  EXPECT_EQ(imp.level, 0);

  imp = normalized_import(Language::Cpp, import_fact("\"net/socket.h\""));
  EXPECT_EQ(imp.module, "net/socket.h");
  EXPECT_EQ(imp.level, 1);
}

TEST(FactNormalizer, AdapterSuppliedLevelIsKept)
{
  auto raw = import_fact("pkg");
  raw.as_import()->level = 2;
  const auto imp = normalized_import(Language::Python, raw);
  EXPECT_EQ(imp.module, "pkg");
  EXPECT_EQ(imp.level, 2);
}

TEST(FactNormalizer, RedundantAliasIsCleared)
{
  auto imp = normalized_import(Language::Python, import_fact("m", "f", "f"));
  EXPECT_TRUE(imp.alias.empty());

  imp = normalized_import(Language::Python, import_fact("numpy", "", "numpy"));
  EXPECT_TRUE(imp.alias.empty());

  imp = normalized_import(Language::Python, import_fact("numpy", "", "np"));
  EXPECT_EQ(imp.alias, "np");
}

TEST(FactNormalizer, MalformedFactsAreDroppedAndReported)
{
  DiagnosticBag diags;
  FactNormalizer norm(Language::Python, &diags);

  EXPECT_FALSE(norm.normalize(import_fact("")).has_value());

  auto no_line = import_fact("os");
  no_line.line = 0;
  EXPECT_FALSE(norm.normalize(no_line).has_value());

  EXPECT_FALSE(norm.normalize(def_fact(DefinitionKind::Function, "", 0, 5)).has_value());
  EXPECT_FALSE(norm.normalize(ref_fact("", 0)).has_value());

  EXPECT_EQ(diags.size(), 4U);
  EXPECT_EQ(diags.of_kind(DiagnosticKind::MalformedFact).size(), 4U);
  EXPECT_FALSE(diags.has_errors());
}

TEST(FactNormalizer, ScopeStackQualifiesAndCloses)
{
  const FactList raw{
    def_fact(DefinitionKind::Container, "A", 0, 100),
    def_fact(DefinitionKind::Function, "f", 10, 50),
    ref_fact("g", 20),
    ref_fact("A.g", 60),
    def_fact(DefinitionKind::Function, "g", 70, 90),
    ref_fact("top", 120),
  };

  FactNormalizer norm(Language::Python);
  const auto out = norm.normalize_all(raw);
  ASSERT_EQ(out.size(), raw.size());

  EXPECT_EQ(out[0].as_definition()->qualified_name, "A");
  EXPECT_EQ(out[1].as_definition()->qualified_name, "A.f");
  EXPECT_EQ(out[2].as_reference()->scope, "A.f");
  EXPECT_EQ(out[3].as_reference()->scope, "A");
  EXPECT_EQ(out[4].as_definition()->qualified_name, "A.g");
  EXPECT_EQ(out[5].as_reference()->scope, "");

  for (const auto & f : out) {
    EXPECT_TRUE(f.normalized);
  }
}

TEST(FactNormalizer, ExplicitContainerJoinsEnclosingOne)
{
  auto raw = def_fact(DefinitionKind::Function, "draw", 0, 10);
  raw.as_definition()->container = "ui::Widget";

  FactNormalizer norm(Language::Cpp);
  const auto out = norm.normalize(raw);
  ASSERT_TRUE(out.has_value());
  EXPECT_EQ(out->as_definition()->container, "ui.Widget");
  EXPECT_EQ(out->as_definition()->qualified_name, "ui.Widget.draw");
}

TEST(FactNormalizer, NormalizingTwiceIsIdentity)
{
  const FactList raw{
    import_fact("..pkg", "x", "x"),
    def_fact(DefinitionKind::Container, "C", 20, 60),
    ref_fact("self.run", 30),
  };

  FactNormalizer norm(Language::Python);
  const auto once = norm.normalize_all(raw);
  const auto twice = norm.normalize_all(once);
  EXPECT_EQ(once, twice);
}

TEST(FactNormalizer, FoldMemberSeparators)
{
  EXPECT_EQ(fold_member_separators("a::b->c.d"), "a.b.c.d");
  EXPECT_EQ(fold_member_separators("plain"), "plain");
  EXPECT_EQ(fold_member_separators(""), "");
}

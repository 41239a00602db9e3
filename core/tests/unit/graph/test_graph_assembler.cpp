// tests/unit/graph/test_graph_assembler.cpp - Facts and resolutions to a graph

#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "seiri/graph/graph_assembler.hpp"

using namespace seiri;

namespace
{

Fact def(DefinitionKind kind, std::string qualified, uint32_t begin, uint32_t end, uint32_t line)
{
  Fact f;
  f.line = line;
  f.span = SourceRange(begin, end);
  f.normalized = true;
  const auto dot = qualified.rfind('.');
  f.data = DefinitionFact{
    kind, dot == std::string::npos ? qualified : qualified.substr(dot + 1), {}, qualified};
  return f;
}

Fact ref(ReferenceKind kind, std::string name, std::string scope, uint32_t begin)
{
  Fact f;
  f.line = 1;
  f.span = SourceRange(begin, begin + 1);
  f.normalized = true;
  f.data = ReferenceFact{kind, std::move(name), std::move(scope)};
  return f;
}

FileIndex python_index(const std::vector<std::string> & rels)
{
  std::vector<DiscoveredFile> files;
  for (const auto & r : rels) {
    files.push_back({"/p/" + r, Language::Python});
  }
  return FileIndex(files, "/p");
}

NodeId def_id(const Graph & g, std::string_view path, std::string_view qn, DefinitionKind kind)
{
  const auto id = g.find_definition(path, qn, kind);
  EXPECT_TRUE(id.has_value()) << path << "#" << qn;
  return id.value_or(0);
}

}  // namespace

TEST(GraphAssembler, MainCallsHelperInUtil)
{
  const auto index = python_index({"main.py", "util.py"});

  std::vector<FileFacts> files(2);
  files[0].file = 0;
  files[0].loc = 4;
  files[0].facts = {
    def(DefinitionKind::Function, "run", 10, 40, 2),
    ref(ReferenceKind::FunctionCall, "helper", "run", 20),
  };
  files[1].file = 1;
  files[1].loc = 2;
  files[1].facts = {def(DefinitionKind::Function, "helper", 0, 20, 1)};

  const std::vector<std::vector<Resolution>> res{{Resolution::to_file(1)}, {}};
  const Graph g = GraphAssembler(index).assemble(files, res);

  EXPECT_EQ(g.count_nodes(NodeKind::File), 2U);
  EXPECT_EQ(g.count_nodes(NodeKind::Definition), 2U);
  EXPECT_EQ(g.count_nodes(NodeKind::External), 0U);

  const NodeId main_file = *g.find_file("main.py");
  const NodeId util_file = *g.find_file("util.py");
  const NodeId run = def_id(g, "main.py", "run", DefinitionKind::Function);
  const NodeId helper = def_id(g, "util.py", "helper", DefinitionKind::Function);

  EXPECT_EQ(main_file, 0U);
  EXPECT_EQ(util_file, 1U);
  EXPECT_TRUE(g.has_edge(main_file, util_file, EdgeKind::Imports));
  EXPECT_TRUE(g.has_edge(main_file, run, EdgeKind::Defines));
  EXPECT_TRUE(g.has_edge(util_file, helper, EdgeKind::Defines));
  EXPECT_TRUE(g.has_edge(run, helper, EdgeKind::References));
  EXPECT_EQ(g.edge_count(), 4U);
}

TEST(GraphAssembler, ContainersOwnTheirMembers)
{
  const auto index = python_index({"shapes.py"});

  std::vector<FileFacts> files(1);
  files[0].facts = {
    def(DefinitionKind::Container, "A", 0, 100, 1),
    def(DefinitionKind::Function, "A.m", 10, 40, 2),
    def(DefinitionKind::Function, "A.n", 50, 90, 4),
    ref(ReferenceKind::FunctionCall, "self.m", "A.n", 60),
    ref(ReferenceKind::FunctionCall, "self.n", "A.n", 70),
    ref(ReferenceKind::ContainerUse, "m", "A.n", 80),
  };

  const Graph g = GraphAssembler(index).assemble(files, {{}});

  const NodeId file = *g.find_file("shapes.py");
  const NodeId a = def_id(g, "shapes.py", "A", DefinitionKind::Container);
  const NodeId m = def_id(g, "shapes.py", "A.m", DefinitionKind::Function);
  const NodeId n = def_id(g, "shapes.py", "A.n", DefinitionKind::Function);

  EXPECT_TRUE(g.has_edge(file, a, EdgeKind::Defines));
  EXPECT_TRUE(g.has_edge(a, m, EdgeKind::Defines));
  EXPECT_TRUE(g.has_edge(a, n, EdgeKind::Defines));
  EXPECT_FALSE(g.has_edge(file, m, EdgeKind::Defines));
  EXPECT_EQ(g.node(file).as_file()->definitions, (std::vector<NodeId>{a}));

  EXPECT_TRUE(g.has_edge(n, m, EdgeKind::References));
  // self.n inside A.n is a self-loop; `m` as a container matches nothing
  EXPECT_EQ(g.count_edges(EdgeKind::References), 1U);
}

TEST(GraphAssembler, ExternalModulesAreShared)
{
  const auto index = python_index({"a.py", "b.py"});
  std::vector<FileFacts> files(2);
  files[0].file = 0;
  files[1].file = 1;

  const std::vector<std::vector<Resolution>> res{
    {Resolution::to_external("os"), Resolution::to_external("os")},
    {Resolution::to_external("os"), Resolution::self_import(1)},
  };
  const Graph g = GraphAssembler(index).assemble(files, res);

  EXPECT_EQ(g.count_nodes(NodeKind::External), 1U);
  const NodeId os = *g.find("ext:os");
  EXPECT_TRUE(g.has_edge(0, os, EdgeKind::Imports));
  EXPECT_TRUE(g.has_edge(1, os, EdgeKind::Imports));
  EXPECT_FALSE(g.has_edge(1, 1, EdgeKind::Imports));
  EXPECT_EQ(g.count_edges(EdgeKind::Imports), 2U);
}

TEST(GraphAssembler, FailedFilesKeepTheirNode)
{
  const auto index = python_index({"ok.py", "broken.py"});
  std::vector<FileFacts> files(2);
  files[0].file = 0;
  files[1].file = 1;
  files[1].parse_failed = true;
  files[1].loc = 3;

  const Graph g = GraphAssembler(index).assemble(files, {{}, {}});
  ASSERT_TRUE(g.find_file("broken.py").has_value());
  EXPECT_EQ(g.node(*g.find_file("broken.py")).as_file()->loc, 3U);
  EXPECT_EQ(g.edge_count(), 0U);
}

TEST(GraphAssembler, ProjectWideMatchUsesDiscoveryOrder)
{
  const auto index = python_index({"x.py", "y.py", "z.py"});
  std::vector<FileFacts> files(3);
  for (size_t i = 0; i < 3; ++i) {
    files[i].file = i;
  }
  files[0].facts = {def(DefinitionKind::Function, "helper", 0, 10, 1)};
  files[1].facts = {def(DefinitionKind::Function, "helper", 0, 10, 1)};
  files[2].facts = {
    ref(ReferenceKind::FunctionCall, "helper", "", 0),
    ref(ReferenceKind::FunctionCall, "nowhere", "", 5),
  };

  const Graph g = GraphAssembler(index).assemble(files, {{}, {}, {}});
  const NodeId z = *g.find_file("z.py");
  const NodeId x_helper = def_id(g, "x.py", "helper", DefinitionKind::Function);

  EXPECT_TRUE(g.has_edge(z, x_helper, EdgeKind::References));
  EXPECT_EQ(g.count_edges(EdgeKind::References), 1U);
}

TEST(GraphAssembler, SameFileDefinitionWinsOverEarlierFile)
{
  const auto index = python_index({"x.py", "y.py"});
  std::vector<FileFacts> files(2);
  files[0].file = 0;
  files[1].file = 1;
  files[0].facts = {def(DefinitionKind::Function, "helper", 0, 10, 1)};
  files[1].facts = {
    def(DefinitionKind::Function, "helper", 0, 10, 1),
    def(DefinitionKind::Function, "main", 20, 40, 3),
    ref(ReferenceKind::FunctionCall, "helper", "main", 25),
  };

  const Graph g = GraphAssembler(index).assemble(files, {{}, {}});
  const NodeId main = def_id(g, "y.py", "main", DefinitionKind::Function);
  const NodeId local = def_id(g, "y.py", "helper", DefinitionKind::Function);
  EXPECT_TRUE(g.has_edge(main, local, EdgeKind::References));
}

TEST(GraphAssembler, StripReceiver)
{
  EXPECT_EQ(strip_receiver("self.run"), "run");
  EXPECT_EQ(strip_receiver("this.a.b"), "a.b");
  EXPECT_EQ(strip_receiver("Self.new"), "new");
  EXPECT_EQ(strip_receiver("obj.run"), "obj.run");
}

// tests/unit/analysis/test_graph_analysis.cpp - SCC and betweenness over file imports

#include <gtest/gtest.h>

#include <vector>

#include "seiri/analysis/graph_analysis.hpp"

using namespace seiri;

TEST(GraphAnalysis, EmptyGraph)
{
  const auto a = analyze_graph(Graph{});
  EXPECT_TRUE(a.files.empty());
  EXPECT_EQ(a.component_count(), 0U);
  EXPECT_TRUE(a.cycles().empty());
  EXPECT_TRUE(a.betweenness.empty());
}

TEST(GraphAnalysis, ImportCycleFormsOneComponent)
{
  Graph g;
  const NodeId a = g.add_file("a.py", Language::Python, 1);
  const NodeId b = g.add_file("b.py", Language::Python, 1);
  const NodeId c = g.add_file("c.py", Language::Python, 1);
  const NodeId os = g.add_external("os");
  const NodeId fn = g.add_definition(a, "f", DefinitionKind::Function, {}, 1);
  g.add_edge(a, b, EdgeKind::Imports);
  g.add_edge(b, a, EdgeKind::Imports);
  g.add_edge(c, a, EdgeKind::Imports);
  g.add_edge(c, os, EdgeKind::Imports);
  g.add_edge(a, fn, EdgeKind::Defines);

  const auto r = analyze_graph(g);
  EXPECT_EQ(r.files, (std::vector<NodeId>{a, b, c}));
  ASSERT_EQ(r.component_count(), 2U);
  EXPECT_EQ(r.components[0], (std::vector<NodeId>{a, b}));
  EXPECT_EQ(r.components[1], (std::vector<NodeId>{c}));
  EXPECT_EQ(r.component_of.at(b), 0U);
  EXPECT_EQ(r.component_of.at(c), 1U);
  EXPECT_EQ(r.largest_component, (std::vector<NodeId>{a, b}));

  const auto cycles = r.cycles();
  ASSERT_EQ(cycles.size(), 1U);
  EXPECT_EQ(cycles[0], (std::vector<NodeId>{a, b}));

  // c -> b only passes through a
  EXPECT_DOUBLE_EQ(r.betweenness.at(a), 0.5);
  EXPECT_DOUBLE_EQ(r.betweenness.at(b), 0.0);
  EXPECT_DOUBLE_EQ(r.betweenness.at(c), 0.0);
  EXPECT_EQ(r.betweenness.count(os), 0U);
}

TEST(GraphAnalysis, ChainMiddleHasHighestBetweenness)
{
  Graph g;
  const NodeId a = g.add_file("a.ts", Language::TypeScript, 1);
  const NodeId b = g.add_file("b.ts", Language::TypeScript, 1);
  const NodeId c = g.add_file("c.ts", Language::TypeScript, 1);
  const NodeId d = g.add_file("d.ts", Language::TypeScript, 1);
  g.add_edge(a, b, EdgeKind::Imports);
  g.add_edge(b, c, EdgeKind::Imports);
  g.add_edge(c, d, EdgeKind::Imports);

  const auto r = analyze_graph(g);
  EXPECT_EQ(r.component_count(), 4U);
  EXPECT_TRUE(r.cycles().empty());
  EXPECT_EQ(r.largest_component, (std::vector<NodeId>{a}));

  // b lies on a->c and a->d; c on a->d and b->d; normalized by 1/6
  EXPECT_DOUBLE_EQ(r.betweenness.at(b), 2.0 / 6.0);
  EXPECT_DOUBLE_EQ(r.betweenness.at(c), 2.0 / 6.0);
  EXPECT_DOUBLE_EQ(r.betweenness.at(a), 0.0);
  EXPECT_DOUBLE_EQ(r.betweenness.at(d), 0.0);
}

TEST(GraphAnalysis, ReferenceEdgesAreIgnored)
{
  Graph g;
  const NodeId a = g.add_file("a.rs", Language::Rust, 1);
  const NodeId b = g.add_file("b.rs", Language::Rust, 1);
  g.add_edge(a, b, EdgeKind::References);
  g.add_edge(b, a, EdgeKind::References);

  const auto r = analyze_graph(g);
  EXPECT_EQ(r.component_count(), 2U);
  EXPECT_TRUE(r.cycles().empty());
}

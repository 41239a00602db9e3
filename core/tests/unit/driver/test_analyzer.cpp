// tests/unit/driver/test_analyzer.cpp - End-to-end pipeline through the Analyzer

#include <gtest/gtest.h>

#include <string>

#include "seiri/driver/analyzer.hpp"
#include "seiri/export/graph_json.hpp"
#include "seiri/test_support/temp_project.hpp"

using namespace seiri;
using seiri::test_support::TempProject;

namespace
{

void write_main_util(const TempProject & tmp)
{
  tmp.write(
    "main.py",
    "from util import helper\n"
    "\n"
    "def run():\n"
    "    helper()\n");
  tmp.write(
    "util.py",
    "def helper():\n"
    "    return 1\n");
}

}  // namespace

TEST(Analyzer, MainCallsHelper)
{
  TempProject tmp("seiri_analyzer");
  write_main_util(tmp);

  const auto r = Analyzer::analyze_directory(tmp.root(), {});
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.exit_status(), 0);
  EXPECT_TRUE(r.diagnostics.empty());

  const Graph & g = r.graph;
  EXPECT_EQ(g.count_nodes(NodeKind::File), 2U);
  EXPECT_EQ(g.count_nodes(NodeKind::Definition), 2U);

  const auto main_file = g.find_file("main.py");
  const auto util_file = g.find_file("util.py");
  const auto run = g.find_definition("main.py", "run", DefinitionKind::Function);
  const auto helper = g.find_definition("util.py", "helper", DefinitionKind::Function);
  ASSERT_TRUE(main_file && util_file && run && helper);

  EXPECT_TRUE(g.has_edge(*main_file, *util_file, EdgeKind::Imports));
  EXPECT_TRUE(g.has_edge(*main_file, *run, EdgeKind::Defines));
  EXPECT_TRUE(g.has_edge(*util_file, *helper, EdgeKind::Defines));
  EXPECT_TRUE(g.has_edge(*run, *helper, EdgeKind::References));
  EXPECT_EQ(g.count_edges(EdgeKind::Imports), 1U);

  EXPECT_EQ(g.node(*main_file).as_file()->loc, 4U);
  EXPECT_FALSE(r.analysis.has_value());
}

TEST(Analyzer, ParseFailureKeepsNodeAndDegradesExitStatus)
{
  TempProject tmp("seiri_analyzer_broken");
  write_main_util(tmp);
  tmp.write("broken.py", "def (:\n    pass\n");

  const auto r = Analyzer::analyze_directory(tmp.root(), {});
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.exit_status(), 2);
  EXPECT_EQ(r.parse_failures(), 1U);
  EXPECT_TRUE(r.diagnostics.has_kind(DiagnosticKind::ParseFailure));

  const auto broken = r.graph.find_file("broken.py");
  ASSERT_TRUE(broken.has_value());
  EXPECT_TRUE(r.graph.node(*broken).as_file()->definitions.empty());

  // The rest of the project is unaffected
  EXPECT_TRUE(r.graph.find_definition("util.py", "helper", DefinitionKind::Function).has_value());
}

TEST(Analyzer, MissingRootIsFatal)
{
  TempProject tmp("seiri_analyzer_missing");
  const auto r = Analyzer::analyze_directory(tmp.path("absent"), {});
  EXPECT_FALSE(r.success);
  EXPECT_EQ(r.exit_status(), 1);
  EXPECT_TRUE(r.diagnostics.has_errors());
  EXPECT_TRUE(r.graph.empty());
}

TEST(Analyzer, EmptyProject)
{
  TempProject tmp("seiri_analyzer_empty");
  tmp.write("docs/readme.md", "nothing to see\n");

  const auto r = Analyzer::analyze_directory(tmp.root(), {});
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.exit_status(), 0);
  EXPECT_EQ(r.graph.node_count(), 0U);
  EXPECT_EQ(r.graph.edge_count(), 0U);
}

TEST(Analyzer, UnresolvedImportsAreInfosOnRequest)
{
  TempProject tmp("seiri_analyzer_unresolved");
  tmp.write("app.py", "import os\nimport json as j\n");

  AnalyzeOptions options;
  options.report_unresolved = true;
  const auto r = Analyzer::analyze_directory(tmp.root(), options);
  ASSERT_TRUE(r.success);

  const auto infos = r.diagnostics.of_kind(DiagnosticKind::UnresolvedImport);
  ASSERT_EQ(infos.size(), 2U);
  EXPECT_EQ(infos[0].severity, Severity::Info);
  EXPECT_EQ(infos[0].position.line, 1U);
  EXPECT_NE(infos[0].message.find("'os'"), std::string::npos);
  EXPECT_EQ(r.exit_status(), 0);

  EXPECT_EQ(r.graph.count_nodes(NodeKind::External), 2U);
  EXPECT_TRUE(r.graph.find("ext:os").has_value());
}

TEST(Analyzer, AnalysisOnRequest)
{
  TempProject tmp("seiri_analyzer_cycle");
  tmp.write("a.py", "import b\n");
  tmp.write("b.py", "import a\n");

  AnalyzeOptions options;
  options.analyze = true;
  const auto r = Analyzer::analyze_directory(tmp.root(), options);
  ASSERT_TRUE(r.analysis.has_value());
  EXPECT_EQ(r.analysis->component_count(), 1U);
  EXPECT_EQ(r.analysis->cycles().size(), 1U);
}

TEST(Analyzer, UnreadableFileIsAnIoWarning)
{
  TempProject tmp("seiri_analyzer_unreadable");
  tmp.write("ok.py", "x = 1\n");

  const std::vector<DiscoveredFile> files{
    {tmp.path("ok.py"), Language::Python},
    {tmp.path("gone.py"), Language::Python},
  };
  const auto r = Analyzer::analyze_files(files, {});
  ASSERT_TRUE(r.success);
  EXPECT_EQ(r.exit_status(), 2);
  EXPECT_TRUE(r.diagnostics.has_kind(DiagnosticKind::Io));
  EXPECT_TRUE(r.graph.find_file("gone.py").has_value());
}

TEST(Analyzer, RepeatedRunsAreIdentical)
{
  TempProject tmp("seiri_analyzer_determinism");
  write_main_util(tmp);
  tmp.write("pkg/__init__.py", "");
  tmp.write("pkg/models.py", "class Model:\n    def save(self):\n        self.validate()\n    def validate(self):\n        pass\n");
  tmp.write("web/app.ts", "import { Model } from './model';\nexport function start() { new Model(); }\n");
  tmp.write("web/model.ts", "export class Model {}\n");

  AnalyzeOptions one_job;
  one_job.jobs = 1;
  AnalyzeOptions many_jobs;
  many_jobs.jobs = 8;

  const auto a = Analyzer::analyze_directory(tmp.root(), one_job);
  const auto b = Analyzer::analyze_directory(tmp.root(), many_jobs);
  EXPECT_EQ(graph_to_json(a.graph, &a.diagnostics), graph_to_json(b.graph, &b.diagnostics));
}

TEST(Analyzer, OptionsFromConfig)
{
  ProjectConfig config;
  config.config_dir = "/work";
  config.project.root = "src";
  config.analysis.jobs = 3;
  config.analysis.exclude = {"gen"};
  config.analysis.languages[Language::Python] = {"pyx"};
  config.analysis.report_unresolved = true;

  const auto options = AnalyzeOptions::from_config(config);
  ASSERT_TRUE(options.root.has_value());
  EXPECT_EQ(options.root->generic_string(), "/work/src");
  EXPECT_EQ(options.jobs, 3U);
  EXPECT_EQ(options.exclude, (std::vector<std::string>{"gen"}));
  EXPECT_TRUE(options.report_unresolved);

  const auto registry = options.make_registry();
  ASSERT_NE(registry.find_for_extension("pyx"), nullptr);
  EXPECT_EQ(registry.find_for_extension("py"), nullptr);
}

#include <gtest/gtest.h>

#include "helpers.hpp"
#include <error.hpp>
#include <fstream>
#include <project.hpp>
#include <render.hpp>
#include <scan.hpp>
#include <sstream>

static const std::filesystem::path PROJ = RESOURCES / "proj";

static project_t resources(void) { return project_t(scan::candidates({ PROJ }, scan::options_t{})); }

TEST(Project, ReadsResources) {
  const auto project = resources();
  ASSERT_EQ(project.documents().size(), 2U);
  EXPECT_EQ(project.documents()[0]->name(), "child.sty");
  EXPECT_EQ(project.documents()[1]->name(), "root.tex");

  const auto &by_name = project.documents_by_name();
  ASSERT_TRUE(by_name.contains("root.tex"));
  const auto &imports = by_name.at("root.tex")->imports();
  EXPECT_EQ(imports.at("child").offset, 16U);
  EXPECT_EQ(imports.at("orphan").options.value_or(""), "[final]");
}

TEST(Project, DependencyFiles) {
  const auto project = resources();
  const auto files   = project.dependency_files();
  ASSERT_EQ(files.size(), 1U);
  EXPECT_EQ(files[0]->name(), "root.tex");

  const auto &root = project.dependencies();
  ASSERT_EQ(root.targets().size(), 1U);
  EXPECT_EQ(root.at("root.tex")->orphans(), std::vector<std::string>{ "orphan" });
  EXPECT_EQ(root.files().size(), 2U);
  EXPECT_EQ(root.at("root.tex")->base_dir(), std::filesystem::absolute(PROJ).lexically_normal());
}

TEST(Project, TreeMatchesStoredJson) {
  std::ifstream input(RESOURCES / "deps.json");
  std::stringstream buffer;
  buffer << input.rdbuf();
  const auto stored = render::load(buffer.str());
  ASSERT_TRUE(stored.has_value());
  const auto tree = render::from_json(stored.value());
  ASSERT_TRUE(tree.has_value());

  const auto project = resources();
  EXPECT_EQ(project.dependencies().tree(), tree.value());
}

TEST(Project, LocationsFollowProjectOrder) {
  const auto project = resources();
  const auto &index  = project.locations_by_name();
  ASSERT_EQ(index.size(), 2U);
  EXPECT_EQ(index.at("foo").document->name(), "root.tex");
  EXPECT_EQ(index.at("childmacro").document->name(), "child.sty");

  const auto &ordered = project.locations();
  ASSERT_EQ(ordered.size(), 2U);
  EXPECT_EQ(ordered[0].definition->name, "childmacro");
  EXPECT_EQ(ordered[1].definition->name, "foo");
  EXPECT_EQ(&project.locations(), &ordered);
}

TEST(Project, ViewsAreCached) {
  const auto project = resources();
  project.prime();
  EXPECT_EQ(&project.dependency_graph(), &project.dependency_graph());
  EXPECT_EQ(&project.dependencies(), &project.dependency_graph().root());
  EXPECT_EQ(&project.documents_by_name(), &project.documents_by_name());
}

TEST(Project, MissingPath) {
  try {
    project_t project({ PROJ / "root.tex", PROJ / "nope.tex" });
    FAIL() << "expected a not found error";
  } catch (const error::error_t &e) {
    EXPECT_EQ(e.kind(), error::kind_t::not_found);
    EXPECT_EQ(std::string(e.what()), "No such file or directory: " + (PROJ / "nope.tex").string());
  }
}

TEST(Project, DirectoryIsNotADocument) {
  EXPECT_THROW(project_t({ PROJ }), error::error_t);
}

TEST(Project, DuplicateNamesLaterWins) {
  project_t project(documents({
    { "a/x.sty", "\\newcommand{\\first}{1}" },
    { "b/x.sty", "\\newcommand{\\second}{2}" },
  }));
  const auto &by_name = project.documents_by_name();
  ASSERT_EQ(by_name.size(), 1U);
  EXPECT_EQ(by_name.at("x.sty")->path(), std::filesystem::path("b/x.sty"));
  EXPECT_EQ(project.documents().size(), 2U);

  const auto &root = project.dependencies();
  ASSERT_EQ(root.targets().size(), 1U);
  ASSERT_NE(root.at("x.sty"), nullptr);
  EXPECT_EQ(root.at("x.sty")->document(), by_name.at("x.sty"));
  EXPECT_EQ(project.dependency_graph().size(), 2U);
  EXPECT_EQ(root.files(), std::vector<std::filesystem::path>{ std::filesystem::absolute("b/x.sty").lexically_normal() });
}

TEST(Project, DuplicateNameImportsUseTheWinner) {
  project_t project(documents({
    { "a/x.sty", "\\usepackage{old}" },
    { "main.tex", "\\usepackage{x}" },
    { "b/x.sty", "\\usepackage{new}" },
  }));
  const auto &root = project.dependencies();
  ASSERT_EQ(root.targets().size(), 1U);
  const auto *x = root.at("main.tex")->at("x.sty");
  ASSERT_NE(x, nullptr);
  EXPECT_EQ(x->document()->path(), std::filesystem::path("b/x.sty"));
  EXPECT_EQ(x->orphans(), std::vector<std::string>{ "new" });
}

TEST(Project, SourceLookupFindsImportedDocuments) {
  const auto project = resources();
  const auto found   = render::lookup(project, "child.sty");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(found.value()->name(), "child.sty");
  EXPECT_EQ(found.value(), project.dependencies().at("root.tex")->at("child.sty"));
  EXPECT_EQ(render::lookup(project, (PROJ / "child.sty").string()), found);
}

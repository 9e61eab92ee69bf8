#include <gtest/gtest.h>

#include "helpers.hpp"
#include <locations.hpp>

TEST(Locations, LastDocumentWins) {
  const auto sources = documents({
    { "a.sty", "\\newcommand{\\x}{a}\\newcommand{\\only}{a}" },
    { "b.tex", "\\renewcommand{\\x}{b}" },
  });
  std::vector<const document_t *> ordered{ sources[0].get(), sources[1].get() };
  const auto index = locations::build(ordered);
  ASSERT_EQ(index.size(), 2U);
  EXPECT_EQ(index.at("x").document, sources[1].get());
  EXPECT_EQ(index.at("x").definition->body.value_or(""), "b");
  EXPECT_EQ(index.at("only").document, sources[0].get());

  std::vector<const document_t *> reversed{ sources[1].get(), sources[0].get() };
  EXPECT_EQ(locations::build(reversed).at("x").document, sources[0].get());
}

TEST(Locations, SortedByName) {
  const auto sources = documents({
    { "a.sty", "\\newcommand{\\zed}{1}\\newcommand{\\alpha}{2}" },
    { "b.tex", "\\newcommand{\\mid}{3}" },
  });
  const auto index = locations::build({ sources[0].get(), sources[1].get() });
  std::vector<std::string> names;
  for (auto &&location : locations::sorted(index)) names.push_back(location.definition->name);
  EXPECT_EQ(names, (std::vector<std::string>{ "alpha", "mid", "zed" }));
}

TEST(Locations, Describe) {
  const auto sources = documents({ { "dir/a.sty", "\\newcommand{\\x}{a}" } });
  const auto index   = locations::build({ sources[0].get() });
  EXPECT_EQ(index.at("x").str(), "x @ (0, 18): a.sty");
}

TEST(Locations, NoDefinitions) {
  const auto sources = documents({ { "a.tex", "\\usepackage{x}" } });
  EXPECT_TRUE(locations::build({ sources[0].get() }).empty());
  EXPECT_TRUE(locations::sorted({}).empty());
}

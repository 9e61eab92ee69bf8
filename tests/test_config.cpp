#include <gtest/gtest.h>

#include "helpers.hpp"
#include <config.hpp>

TEST(Config, Defaults) {
  const auto result = config::parse("");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.scan.extensions, (std::set<std::string>{ "sty", "tex" }));
  EXPECT_TRUE(result.config.scan.recurse);
  EXPECT_EQ(result.config.level, jot::level_t::warn);
}

TEST(Config, Values) {
  const auto result = config::parse("scan:\n"
                                    "  extensions: [.tex, cls]\n"
                                    "  recurse: false\n"
                                    "log:\n"
                                    "  level: debug\n");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.scan.extensions, (std::set<std::string>{ "cls", "tex" }));
  EXPECT_FALSE(result.config.scan.recurse);
  EXPECT_EQ(result.config.level, jot::level_t::debug);
}

TEST(Config, InvalidLevel) {
  const auto result = config::parse("log:\n  level: loud\n");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "invalid log.level: 'loud'");
}

TEST(Config, WrongShapes) {
  EXPECT_FALSE(config::parse("- a\n- b\n").success);
  EXPECT_FALSE(config::parse("scan: 3\n").success);
  EXPECT_FALSE(config::parse("scan:\n  extensions: tex\n").success);
  EXPECT_FALSE(config::parse("log: [a]\n").success);
}

TEST(Config, InvalidYaml) {
  const auto result = config::parse("scan: [unclosed\n");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error.rfind("failed to parse YAML: ", 0), 0U);
}

TEST(Config, MissingFile) {
  const auto result = config::load(RESOURCES / "absent.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "configuration file not found: " + (RESOURCES / "absent.yaml").string());
}

TEST(Config, LoadAndFind) {
  tmpdir_t dir("texdeps_config");
  const auto file = dir.write("texdeps.yaml", "log:\n  level: info\n");
  dir.write("chapters/one.tex", "");

  const auto found = config::find(dir.path / "chapters");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(std::filesystem::canonical(found.value()), std::filesystem::canonical(file));
  EXPECT_EQ(config::find(dir.path / "chapters" / "one.tex"), found);

  const auto result = config::load(found.value());
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_EQ(result.config.level, jot::level_t::info);
  EXPECT_EQ(result.config.source, found.value());
}

TEST(Config, LevelNames) {
  EXPECT_EQ(jot::parse_level("error"), jot::level_t::error);
  EXPECT_FALSE(jot::parse_level("ERROR").has_value());
  EXPECT_EQ(jot::level_name(jot::level_t::fatal), "fatal");
}

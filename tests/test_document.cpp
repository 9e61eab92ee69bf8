#include <gtest/gtest.h>

#include "helpers.hpp"
#include <document.hpp>
#include <error.hpp>

TEST(Document, InMemory) {
  const document_t document("dir/main.tex", "\\usepackage{a}\n\\newcommand{\\x}{y}\n");
  EXPECT_EQ(document.name(), "main.tex");
  EXPECT_EQ(document.path(), std::filesystem::path("dir/main.tex"));
  EXPECT_TRUE(document.imports().contains("a"));
  EXPECT_TRUE(document.definitions().contains("x"));
  EXPECT_TRUE(document.failures().empty());
}

TEST(Document, ReadsFromDisk) {
  const document_t document(RESOURCES / "proj" / "root.tex");
  EXPECT_EQ(document.name(), "root.tex");
  ASSERT_EQ(document.imports().size(), 2U);
  EXPECT_EQ(document.imports().at("child").offset, 16U);
  EXPECT_TRUE(document.imports().contains("orphan"));
  EXPECT_EQ(document.definitions().at("foo").body.value_or(""), "bar #1");
}

TEST(Document, ReadsOnce) {
  tmpdir_t dir("texdeps_document_once");
  const auto file = dir.write("a.tex", "\\usepackage{b}\n");
  const document_t document(file);
  const std::string &text = document.text();
  std::filesystem::remove(file);
  EXPECT_EQ(&document.text(), &text);
  EXPECT_EQ(document.text(), "\\usepackage{b}\n");
  EXPECT_TRUE(document.imports().contains("b"));
}

TEST(Document, ExtractsOnce) {
  const document_t document("a.tex", "\\usepackage{b}");
  const auto *imports = &document.imports();
  EXPECT_EQ(&document.imports(), imports);
  EXPECT_EQ(&document.failures(), &document.failures());
}

TEST(Document, MissingFile) {
  const document_t document(RESOURCES / "proj" / "missing.tex");
  EXPECT_EQ(document.name(), "missing.tex");
  try {
    document.imports();
    FAIL() << "expected an io error";
  } catch (const error::error_t &e) {
    EXPECT_EQ(e.kind(), error::kind_t::io);
    EXPECT_EQ(e.path().filename(), "missing.tex");
  }
}

TEST(Document, FailuresNameThePath) {
  const document_t document("broken.tex", "\\usepackage{child\n\\usepackage{other}\n");
  ASSERT_EQ(document.failures().size(), 1U);
  EXPECT_EQ(document.failures().front().path, std::filesystem::path("broken.tex"));
  EXPECT_TRUE(document.imports().contains("other"));
}

#include <gtest/gtest.h>

#include "helpers.hpp"
#include <error.hpp>
#include <scan.hpp>

typedef std::vector<std::filesystem::path> paths_t;

TEST(Scan, Split) {
  EXPECT_EQ(scan::split("a.tex:dir::b.sty"), (paths_t{ "a.tex", "dir", "b.sty" }));
  EXPECT_EQ(scan::split("."), (paths_t{ "." }));
  EXPECT_TRUE(scan::split("").empty());
  EXPECT_TRUE(scan::split(":").empty());
}

TEST(Scan, DirectoryInNameOrder) {
  tmpdir_t dir("texdeps_scan_order");
  dir.write("b.tex", "");
  dir.write("a.sty", "");
  dir.write("notes.txt", "");
  dir.write("sub/c.tex", "");
  const auto found = scan::candidates({ dir.path }, scan::options_t{});
  EXPECT_EQ(found, (paths_t{ dir.path / "a.sty", dir.path / "b.tex", dir.path / "sub" / "c.tex" }));
}

TEST(Scan, WithoutRecursion) {
  tmpdir_t dir("texdeps_scan_flat");
  dir.write("a.tex", "");
  dir.write("sub/b.tex", "");
  scan::options_t options;
  options.recurse = false;
  EXPECT_EQ(scan::candidates({ dir.path }, options), (paths_t{ dir.path / "a.tex" }));
}

TEST(Scan, CustomExtensions) {
  tmpdir_t dir("texdeps_scan_ext");
  dir.write("a.tex", "");
  dir.write("b.cls", "");
  scan::options_t options;
  options.extensions = { "cls" };
  EXPECT_EQ(scan::candidates({ dir.path }, options), (paths_t{ dir.path / "b.cls" }));
}

TEST(Scan, FilesKeepTheirOrder) {
  const auto proj  = RESOURCES / "proj";
  const auto found = scan::candidates({ proj / "root.tex", proj / "child.sty" }, scan::options_t{});
  EXPECT_EQ(found, (paths_t{ proj / "root.tex", proj / "child.sty" }));
}

TEST(Scan, MissingPath) {
  const auto missing = RESOURCES / "nowhere";
  try {
    scan::candidates({ missing }, scan::options_t{});
    FAIL() << "expected a not found error";
  } catch (const error::error_t &e) {
    EXPECT_EQ(e.kind(), error::kind_t::not_found);
    EXPECT_EQ(e.path(), missing);
    EXPECT_EQ(std::string(e.what()), "No such file or directory: " + missing.string());
  }
}

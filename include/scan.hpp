#ifndef SCAN_HPP
#define SCAN_HPP

#pragma once

#include <filesystem>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace scan {
struct options_t {
  // extensions without the dot
  std::set<std::string> extensions = { "tex", "sty" };
  bool recurse                     = true;
};

// Files under `paths` to parse. A file is kept when its extension is
// candidate; a directory contributes its entries in name order, descending
// into subdirectories only with `recurse`. Throws error::error_t (not found)
// for a path that is neither.
std::vector<std::filesystem::path> candidates(const std::vector<std::filesystem::path> &paths,
                                              const options_t &options);

// splits a `:` separated path list, dropping empty entries
std::vector<std::filesystem::path> split(std::string_view list);
} // namespace scan

#endif

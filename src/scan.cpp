#include <scan.hpp>

#include <algorithm>
#include <error.hpp>
#include <fmt/format.h>
#include <jot.hpp>
#include <types.hpp>

typedef std::filesystem::path path_t;

static void collect(const path_t &path, const scan::options_t &options, std::vector<path_t> &out) {
  if (std::filesystem::is_regular_file(path)) {
    std::string extension = path.extension().string();
    if (!extension.empty()) extension.erase(0, 1);
    if (options.extensions.contains(extension)) {
      out.push_back(path);
    } else {
      jot::debug("scan: skipping `{}`", path.string());
    }
  } else if (std::filesystem::is_directory(path)) {
    std::vector<path_t> entries;
    for (auto &&entry : std::filesystem::directory_iterator(path)) entries.push_back(entry.path());
    std::sort(entries.begin(), entries.end());
    for (auto &&entry : entries) {
      if (!options.recurse && std::filesystem::is_directory(entry)) continue;
      collect(entry, options, out);
    }
  } else {
    throw error::error_t(error::kind_t::not_found, fmt::format("No such file or directory: {}", path.string()), path);
  }
}

namespace scan {
std::vector<path_t> candidates(const std::vector<path_t> &paths, const options_t &options) {
  std::vector<path_t> out;
  for (auto &&path : paths) collect(path, options, out);
  jot::debug("scan: {} candidate files", out.size());
  return out;
}

std::vector<path_t> split(std::string_view list) {
  std::vector<path_t> paths;
  while (!list.empty()) {
    const u64 sep = list.find(':');
    std::string_view part = list.substr(0, sep);
    if (!part.empty()) paths.emplace_back(part);
    if (sep == std::string_view::npos) break;
    list.remove_prefix(sep + 1);
  }
  return paths;
}
} // namespace scan

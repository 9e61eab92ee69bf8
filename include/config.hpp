#ifndef CONFIG_HPP
#define CONFIG_HPP

#pragma once

#include <filesystem>
#include <jot.hpp>
#include <optional>
#include <scan.hpp>
#include <string>
#include <string_view>

namespace config {
static constexpr std::string_view FILE_NAME = "texdeps.yaml";

// texdeps.yaml:
//
//   scan:
//     extensions: [tex, sty]
//     recurse: true
//   log:
//     level: warn
struct config_t {
  scan::options_t scan;
  jot::level_t level = jot::level_t::warn;
  // file the values came from, empty for defaults
  std::filesystem::path source;
};

struct load_t {
  config_t config;
  bool success = false;
  std::string error;

  static load_t ok(config_t config) {
    load_t result;
    result.config  = std::move(config);
    result.success = true;
    return result;
  }
  static load_t fail(std::string message) {
    load_t result;
    result.error = std::move(message);
    return result;
  }
};

load_t load(const std::filesystem::path &path);
// parses configuration text; `source` only names it in messages
load_t parse(std::string_view text, const std::filesystem::path &source = {});
// nearest texdeps.yaml in `start` or one of its parents
std::optional<std::filesystem::path> find(const std::filesystem::path &start);
} // namespace config

#endif

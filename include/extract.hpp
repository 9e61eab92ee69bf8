#ifndef EXTRACT_HPP
#define EXTRACT_HPP

#pragma once

#include <error.hpp>
#include <filesystem>
#include <latex.hpp>
#include <optional>
#include <ordmap.hpp>
#include <string>
#include <string_view>
#include <types.hpp>
#include <vector>

namespace extract {
// half open character range [begin, end) in the document text
struct span_t {
  u64 begin, end;
  bool operator==(const span_t &) const = default;
};

// one `\usepackage[options]{name}`
struct usepackage_t {
  std::string name;
  std::optional<std::string> options;
  u64 offset;
  span_t span;

  std::string str(void) const;
};

// one `\newcommand{\name}[args][default]{body}` (or renew/provide)
struct newcommand_t {
  std::string name;
  std::string definer;
  span_t span;
  std::string arg_spec;
  std::optional<std::string> body;
  std::string raw;

  std::string str(void) const;
};

typedef ordmap_t<std::string, usepackage_t> imports_t;
typedef ordmap_t<std::string, newcommand_t> definitions_t;

struct result_t {
  imports_t imports;
  definitions_t definitions;
  std::vector<error::failure_t> failures;
};

// Scans the top level `nodes` of `text` once for package imports and macro
// definitions. Both mappings upsert: a later occurrence of a name replaces the
// earlier one and keeps its position. Malformed imports are recorded as parse
// failures against `path` and the scan goes on with the next node.
result_t run(const std::vector<latex::node_t> &nodes, std::string_view text, const std::filesystem::path &path);
} // namespace extract

#endif

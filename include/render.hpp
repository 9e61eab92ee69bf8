#ifndef RENDER_HPP
#define RENDER_HPP

#pragma once

#include <depgraph.hpp>
#include <filesystem>
#include <json/json.h>
#include <optional>
#include <project.hpp>
#include <string>
#include <string_view>
#include <vector>

namespace render {
enum class format_t { txt, json, yaml, list };

std::optional<format_t> parse_format(std::string_view name);

// left aligned ascii tree
std::string text(const depgraph::tree_t &tree);
// {key: {child: {...}}}; object members come out sorted by key
Json::Value json(const depgraph::tree_t &tree);
// inverse of `json`; nullopt unless `value` is an object with a single member
// whose nested values are all objects
std::optional<depgraph::tree_t> from_json(const Json::Value &value);
std::string dump(const Json::Value &value);
std::optional<Json::Value> load(std::string_view text);
std::string yaml(const depgraph::tree_t &tree);
std::string list(const std::vector<std::filesystem::path> &files);

// `name: (targets)` lines per node with its orphans, children indented
std::string outline(const depgraph::dep_t &dep, const std::optional<std::filesystem::path> &base = std::nullopt);

// per document imports, definitions and failures
std::string files_text(const project_t &project);
Json::Value files_json(const project_t &project);
std::string files_yaml(const project_t &project);

// macro definitions sorted by name with the file they come from
std::string commands(const project_t &project);

// Resolves a user supplied source against the documents of `project`: the
// document name, then a document with the same path, then one with the same
// file name. The result is the document's node in the dependency graph.
std::optional<const depgraph::dep_t *> lookup(const project_t &project, std::string_view name);
} // namespace render

#endif

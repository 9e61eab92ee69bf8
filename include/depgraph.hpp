#ifndef DEPGRAPH_HPP
#define DEPGRAPH_HPP

#pragma once

#include <deque>
#include <document.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <ordmap.hpp>
#include <set>
#include <string>
#include <string_view>
#include <types.hpp>
#include <variant>
#include <vector>

namespace depgraph {
// source of the synthetic node aggregating a whole project
struct root_t {};

static constexpr std::string_view ROOT = "root";
static constexpr std::string_view PACKAGE_SUFFIX = ".sty";

// nested {key: {child: {...}}} view of a dependency node, children sorted by key
struct tree_t {
  std::string key;
  std::vector<tree_t> children;

  bool operator==(const tree_t &) const = default;
  const tree_t *find(std::string_view key) const;
};

class dep_t;

// import key -> child node; nullptr marks an orphan (imported, not in the project)
typedef ordmap_t<std::string, const dep_t *> targets_t;

class dep_t {
  friend class graph_t;

private:
  std::variant<root_t, const document_t *> _source;
  targets_t _targets;
  bool resolving;

  void collect(std::vector<const document_t *> &out, std::set<const dep_t *> &seen) const;
  tree_t flat(const std::string &key, const std::optional<std::filesystem::path> &base,
              std::vector<const dep_t *> &stack) const;

public:
  explicit dep_t(std::variant<root_t, const document_t *> source)
    : _source(std::move(source)), resolving(false) {}

  bool is_root(void) const { return std::holds_alternative<root_t>(this->_source); }
  // nullptr for the root node
  const document_t *document(void) const;
  // document name, or "root"
  std::string name(void) const;
  const targets_t &targets(void) const { return this->_targets; }
  bool contains(const std::string &key) const { return this->_targets.contains(key); }
  // child under `key`, nullptr for an orphan; throws std::out_of_range for an unknown key
  const dep_t *at(const std::string &key) const { return this->_targets.at(key); }

  // import names (key without the .sty suffix) of targets not found in the project
  std::vector<std::string> orphans(void) const;
  // reachable documents, each once, children before their importer
  std::vector<const document_t *> documents(void) const;
  // absolute paths of the reachable documents, sorted
  std::vector<std::filesystem::path> files(void) const;
  // deepest directory containing every reachable document; absent for root
  std::optional<std::filesystem::path> base_dir(void) const;
  // with `base`, document keys are paths relative to it
  tree_t tree(const std::optional<std::filesystem::path> &base = std::nullopt) const;
};

// Dependency nodes of one resolution run. Nodes live in an arena and are
// memoized by document name, so every import of a document refers to the one
// node. The graph is frozen once `resolve` returns.
class graph_t {
private:
  std::deque<dep_t> arena;
  std::map<std::string, dep_t *> memo;
  dep_t *_root;
  u64 _cycles;

  dep_t *expand(const document_t &document, const std::map<std::string, const document_t *> &by_name);
  // expands `document` as a target of the root
  void adopt(const document_t &document, const std::map<std::string, const document_t *> &by_name);

public:
  graph_t(void);
  graph_t(const graph_t &)            = delete;
  graph_t &operator=(const graph_t &) = delete;
  graph_t(graph_t &&)                 = default;
  graph_t &operator=(graph_t &&)      = default;

  const dep_t &root(void) const { return *this->_root; }
  // node of a document by name, nullptr when the document is not in the graph
  const dep_t *find(const std::string &name) const;
  u64 size(void) const { return this->arena.size(); }
  // imports that led back to a document still being expanded
  u64 cycles(void) const { return this->_cycles; }

  friend graph_t resolve(const std::vector<const document_t *> &documents,
                         const std::map<std::string, const document_t *> &by_name);
};

// Expands the imports of `documents` recursively. Import `x` is looked up as
// `x.sty` in `by_name`. Documents no other document imports are the root's
// targets, in order; documents reachable only through a cycle are appended.
// A document whose name `by_name` maps to another document is left out.
graph_t resolve(const std::vector<const document_t *> &documents,
                const std::map<std::string, const document_t *> &by_name);

// deepest directory containing every path
std::optional<std::filesystem::path> common_base(const std::vector<std::filesystem::path> &paths);
} // namespace depgraph

#endif

#include <depgraph.hpp>

#include <algorithm>
#include <jot.hpp>

typedef std::filesystem::path path_t;

static path_t normalized(const path_t &path) { return std::filesystem::absolute(path).lexically_normal(); }

// true when `path` is `base` or lies below it
static bool within(const path_t &path, const path_t &base) {
  auto [end, _] = std::mismatch(base.begin(), base.end(), path.begin(), path.end());
  return end == base.end();
}

static u64 segments(const path_t &path) { return std::distance(path.begin(), path.end()); }

namespace depgraph {
const tree_t *tree_t::find(std::string_view key) const {
  for (auto &&child : this->children)
    if (child.key == key) return &child;
  return nullptr;
}

const document_t *dep_t::document(void) const {
  if (this->is_root()) return nullptr;
  return std::get<const document_t *>(this->_source);
}

std::string dep_t::name(void) const { return this->is_root() ? std::string(ROOT) : this->document()->name(); }

std::vector<std::string> dep_t::orphans(void) const {
  std::vector<std::string> names;
  for (auto &&[key, node] : this->_targets) {
    if (node != nullptr) continue;
    std::string_view name = key;
    if (name.ends_with(PACKAGE_SUFFIX)) name.remove_suffix(PACKAGE_SUFFIX.size());
    names.emplace_back(name);
  }
  return names;
}

void dep_t::collect(std::vector<const document_t *> &out, std::set<const dep_t *> &seen) const {
  if (!seen.insert(this).second) return;
  for (auto &&[_, node] : this->_targets)
    if (node != nullptr) node->collect(out, seen);
  if (!this->is_root()) out.push_back(this->document());
}

std::vector<const document_t *> dep_t::documents(void) const {
  std::vector<const document_t *> out;
  std::set<const dep_t *> seen;
  this->collect(out, seen);
  return out;
}

std::vector<path_t> dep_t::files(void) const {
  std::vector<path_t> paths;
  for (auto &&document : this->documents()) paths.push_back(normalized(document->path()));
  std::sort(paths.begin(), paths.end());
  paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
  return paths;
}

std::optional<path_t> dep_t::base_dir(void) const {
  if (this->is_root()) return std::nullopt;
  return common_base(this->files());
}

tree_t dep_t::flat(const std::string &key, const std::optional<path_t> &base, std::vector<const dep_t *> &stack) const {
  tree_t tree{ key, {} };
  // a node already being rendered is an import cycle, shown as a leaf
  if (std::find(stack.begin(), stack.end(), this) != stack.end()) return tree;
  stack.push_back(this);
  for (auto &&[name, node] : this->_targets) {
    if (node == nullptr || !base.has_value()) {
      tree.children.push_back(node == nullptr ? tree_t{ name, {} } : node->flat(name, base, stack));
    } else {
      const path_t relative = normalized(node->document()->path()).lexically_relative(base.value());
      tree.children.push_back(node->flat(relative.string(), base, stack));
    }
  }
  stack.pop_back();
  std::sort(tree.children.begin(), tree.children.end(),
            [](const tree_t &a, const tree_t &b) { return a.key < b.key; });
  return tree;
}

tree_t dep_t::tree(const std::optional<path_t> &base) const {
  std::string key = this->name();
  if (base.has_value() && !this->is_root())
    key = normalized(this->document()->path()).lexically_relative(base.value()).string();
  std::vector<const dep_t *> stack;
  return this->flat(key, base, stack);
}

graph_t::graph_t(void) : _cycles(0) {
  this->arena.emplace_back(root_t{});
  this->_root = &this->arena.back();
}

const dep_t *graph_t::find(const std::string &name) const {
  auto it = this->memo.find(name);
  return it == this->memo.end() ? nullptr : it->second;
}

dep_t *graph_t::expand(const document_t &document, const std::map<std::string, const document_t *> &by_name) {
  const std::string name = document.name();
  if (auto it = this->memo.find(name); it != this->memo.end()) {
    if (it->second->resolving) {
      this->_cycles++;
      jot::debug("depgraph: import cycle back to `{}`", name);
    }
    return it->second;
  }
  dep_t *node = &this->arena.emplace_back(&document);
  // registered before the imports are expanded so cycles end here
  this->memo.emplace(name, node);
  node->resolving = true;
  for (auto &&[package, _] : document.imports()) {
    const std::string key = package + std::string(PACKAGE_SUFFIX);
    auto target           = by_name.find(key);
    jot::debug("depgraph: {} -> ({}) {}", name, package, target == by_name.end() ? "orphan" : key);
    if (target == by_name.end()) {
      node->_targets.upsert(key, nullptr);
    } else {
      node->_targets.upsert(key, this->expand(*target->second, by_name));
    }
  }
  node->resolving = false;
  return node;
}

void graph_t::adopt(const document_t &document, const std::map<std::string, const document_t *> &by_name) {
  this->_root->_targets.upsert(document.name(), this->expand(document, by_name));
}

// false for a document whose name `by_name` maps to another document
static bool visible(const document_t *document, const std::map<std::string, const document_t *> &by_name) {
  auto it = by_name.find(document->name());
  return it == by_name.end() || it->second == document;
}

graph_t resolve(const std::vector<const document_t *> &documents,
                const std::map<std::string, const document_t *> &by_name) {
  graph_t graph;
  std::set<std::string> imported;
  for (auto &&document : documents) {
    if (!visible(document, by_name)) {
      jot::debug("depgraph: `{}` shadowed by a later document", document->path().string());
      continue;
    }
    for (auto &&[package, _] : document->imports()) {
      const std::string key = package + std::string(PACKAGE_SUFFIX);
      if (by_name.contains(key)) imported.insert(key);
    }
  }
  for (auto &&document : documents) {
    if (!visible(document, by_name) || imported.contains(document->name())) continue;
    graph.adopt(*document, by_name);
  }
  for (auto &&document : documents) {
    if (!visible(document, by_name) || graph.memo.contains(document->name())) continue;
    jot::debug("depgraph: `{}` only reachable through a cycle", document->name());
    graph.adopt(*document, by_name);
  }
  jot::debug("depgraph: {} nodes, {} root targets, {} cycles", graph.size() - 1, graph.root().targets().size(),
             graph.cycles());
  return graph;
}

std::optional<path_t> common_base(const std::vector<path_t> &paths) {
  if (paths.empty()) return std::nullopt;
  std::vector<path_t> files;
  for (auto &&path : paths) files.push_back(normalized(path));
  std::sort(files.begin(), files.end(), [](const path_t &a, const path_t &b) { return segments(a) < segments(b); });
  path_t base = files.front().parent_path();
  while (true) {
    bool ok = std::all_of(files.begin(), files.end(), [&](const path_t &file) { return within(file, base); });
    if (ok || base == base.parent_path()) return base;
    base = base.parent_path();
  }
}
} // namespace depgraph

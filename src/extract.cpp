#include <extract.hpp>

#include <fmt/format.h>
#include <jot.hpp>

typedef std::vector<latex::node_t> nodes_t;

namespace {
struct scanner_t {
  const nodes_t &nodes;
  std::string_view text;
  const std::filesystem::path &path;
  extract::result_t result;

  void fail(u64 offset, std::string message) {
    jot::debug("extract: {} at {} in `{}`", message, offset, this->path.string());
    this->result.failures.push_back(error::failure_t{ error::kind_t::parse, this->path, std::move(message), offset });
  }

  void usepackage(u64 i);
  void newcommand(u64 i);
  void run(void);
};

// name group of a usepackage: a group starting with a character run
const latex::chars_t *package_name(const latex::node_t &node, std::string &reason) {
  switch (node.kind()) {
  case latex::kind_t::group: {
    const auto &children = node.as<latex::group_t>()->children;
    if (children.empty() || children.front().kind() != latex::kind_t::chars) {
      reason = "expecting package name characters in group";
      return nullptr;
    }
    return children.front().as<latex::chars_t>();
  }
  default: reason = fmt::format("expecting group node but found {}", latex::kind_name(node.kind())); return nullptr;
  }
}

void scanner_t::usepackage(u64 i) {
  const auto &macro = this->nodes[i];
  const u64 n       = this->nodes.size();
  if (i + 1 >= n) {
    this->fail(macro.offset(), "missing package name after `\\usepackage`");
    return;
  }
  std::optional<std::string> options;
  u64 group = i + 1;
  switch (this->nodes[i + 1].kind()) {
  case latex::kind_t::group: break;
  case latex::kind_t::chars:
    options = this->nodes[i + 1].as<latex::chars_t>()->text;
    group   = i + 2;
    if (group >= n) {
      this->fail(macro.offset(), "missing package name after `\\usepackage` options");
      return;
    }
    break;
  default: {
    std::string_view source = latex::verbatim(this->text, macro);
    this->fail(macro.offset(), fmt::format("unknown usepackage syntax '{}'", source));
    return;
  }
  }
  std::string reason;
  const latex::chars_t *name = package_name(this->nodes[group], reason);
  if (name == nullptr) {
    this->fail(this->nodes[group].offset(), reason);
    return;
  }
  extract::usepackage_t package{
    .name    = name->text,
    .options = std::move(options),
    .offset  = macro.offset(),
    .span    = { macro.offset(), this->nodes[group].end() },
  };
  auto previous = this->result.imports.upsert(package.name, package);
  if (previous.has_value())
    jot::info("replacing previously <{}> with <{}> in `{}`", previous->str(), package.str(), this->path.string());
}

void scanner_t::newcommand(u64 i) {
  const auto &definer = this->nodes[i];
  const u64 n         = this->nodes.size();
  if (i + 1 >= n) {
    this->fail(definer.offset(), fmt::format("missing macro name after `\\{}`", definer.as<latex::macro_t>()->name));
    return;
  }
  const auto &head            = this->nodes[i + 1];
  const latex::group_t *group = head.as<latex::group_t>();
  if (group == nullptr || group->children.empty() || group->children.front().kind() != latex::kind_t::macro) {
    jot::info("un-parsable macro: {}{} at {} in `{}`", latex::verbatim(this->text, definer),
              latex::verbatim(this->text, head), definer.offset(), this->path.string());
    return;
  }

  u64 j = i + 2;
  std::string arg_spec;
  while (j < n) {
    const auto kind = this->nodes[j].kind();
    if (kind == latex::kind_t::group || kind == latex::kind_t::comment) break;
    arg_spec += latex::verbatim(this->text, this->nodes[j]);
    j++;
  }

  std::optional<std::string> body;
  u64 end = j > i + 2 ? this->nodes[j - 1].end() : head.end();
  if (j < n && this->nodes[j].kind() == latex::kind_t::group) {
    const auto &node = this->nodes[j];
    body             = std::string(this->text.substr(node.offset() + 1, node.length() - 2));
    end              = node.end();
  }

  extract::newcommand_t command{
    .name     = group->children.front().as<latex::macro_t>()->name,
    .definer  = definer.as<latex::macro_t>()->name,
    .span     = { definer.offset(), end },
    .arg_spec = std::move(arg_spec),
    .body     = std::move(body),
    .raw      = std::string(this->text.substr(definer.offset(), end - definer.offset())),
  };
  std::string name = command.name;
  this->result.definitions.upsert(name, std::move(command));
}

void scanner_t::run(void) {
  static constexpr std::string_view COMMAND = "command";
  // every top level index is visited; nodes consumed by an occurrence are
  // groups and character runs, except macros in an argument spec
  for (u64 i = 0; i < this->nodes.size(); i++) {
    const latex::macro_t *macro = this->nodes[i].as<latex::macro_t>();
    if (macro == nullptr) continue;
    if (macro->name == "usepackage") {
      this->usepackage(i);
    } else if (macro->name.ends_with(COMMAND)) {
      this->newcommand(i);
    }
  }
}
} // namespace

namespace extract {
std::string usepackage_t::str(void) const {
  return fmt::format("{} @ ({}, {})", this->name, this->span.begin, this->span.end);
}

std::string newcommand_t::str(void) const {
  return fmt::format("{} @ ({}, {})", this->name, this->span.begin, this->span.end);
}

result_t run(const std::vector<latex::node_t> &nodes, std::string_view text, const std::filesystem::path &path) {
  scanner_t scanner{ nodes, text, path, {} };
  scanner.run();
  jot::debug("extract: {} imports, {} definitions, {} failures in `{}`", scanner.result.imports.size(),
             scanner.result.definitions.size(), scanner.result.failures.size(), path.string());
  return std::move(scanner.result);
}
} // namespace extract

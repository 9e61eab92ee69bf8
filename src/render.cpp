#include <render.hpp>

#include <algorithm>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <iterator>
#include <jot.hpp>
#include <memory>
#include <yaml-cpp/yaml.h>

typedef std::filesystem::path path_t;
typedef std::back_insert_iterator<std::string> out_t;

static void line(std::string &out, u64 depth, std::string_view text) {
  fmt::format_to(out_t(out), "{:{}}{}\n", "", depth * 2, text);
}

static void draw(const depgraph::tree_t &tree, const std::string &prefix, std::string &out) {
  for (u64 i = 0; i < tree.children.size(); i++) {
    const bool last    = i + 1 == tree.children.size();
    const auto &child = tree.children[i];
    fmt::format_to(out_t(out), "{} +-- {}\n", prefix, child.key);
    draw(child, prefix + (last ? "     " : " |   "), out);
  }
}

static Json::Value members(const depgraph::tree_t &tree) {
  Json::Value value(Json::objectValue);
  for (auto &&child : tree.children) value[child.key] = members(child);
  return value;
}

static std::optional<depgraph::tree_t> unfold(const std::string &key, const Json::Value &value) {
  if (!value.isObject()) return std::nullopt;
  depgraph::tree_t tree{ key, {} };
  for (auto &&name : value.getMemberNames()) {
    auto child = unfold(name, value[name]);
    if (!child.has_value()) return std::nullopt;
    tree.children.push_back(std::move(child.value()));
  }
  return tree;
}

static void emit(YAML::Emitter &out, const depgraph::tree_t &tree) {
  if (tree.children.empty()) {
    out << YAML::Flow << YAML::BeginMap << YAML::EndMap;
    return;
  }
  out << YAML::BeginMap;
  for (auto &&child : tree.children) {
    out << YAML::Key << child.key << YAML::Value;
    emit(out, child);
  }
  out << YAML::EndMap;
}

static void outline(const depgraph::dep_t &dep, u64 depth, const std::optional<path_t> &base,
                    std::vector<const depgraph::dep_t *> &stack, std::string &out) {
  std::string source = dep.name();
  if (base.has_value() && !dep.is_root()) {
    path_t relative = std::filesystem::absolute(dep.document()->path()).lexically_normal().lexically_relative(*base);
    if (relative != path_t(".")) source = relative.string();
  }
  line(out, depth, fmt::format("{}: ({})", source, dep.targets().size()));
  if (std::find(stack.begin(), stack.end(), &dep) != stack.end()) return;
  const auto orphans = dep.orphans();
  if (!orphans.empty()) line(out, depth + 1, fmt::format("orphans: {}", fmt::join(orphans, ", ")));
  stack.push_back(&dep);
  for (auto &&[_, target] : dep.targets())
    if (target != nullptr) outline(*target, depth + 1, base, stack, out);
  stack.pop_back();
}

static std::vector<const document_t *> by_file_name(const project_t &project) {
  std::vector<const document_t *> documents;
  for (auto &&[_, document] : project.documents_by_name()) documents.push_back(document);
  std::sort(documents.begin(), documents.end(),
            [](const document_t *a, const document_t *b) { return a->path().filename() < b->path().filename(); });
  return documents;
}

static Json::Value span(const extract::span_t &span) {
  Json::Value value(Json::arrayValue);
  value.append(Json::UInt64(span.begin));
  value.append(Json::UInt64(span.end));
  return value;
}

static Json::Value document_json(const document_t &document) {
  Json::Value value(Json::objectValue);
  Json::Value packages(Json::objectValue);
  for (auto &&[name, package] : document.imports()) {
    Json::Value entry(Json::objectValue);
    entry["name"] = package.name;
    entry["span"] = span(package.span);
    if (package.options.has_value()) entry["options"] = package.options.value();
    packages[name] = entry;
  }
  Json::Value commands(Json::objectValue);
  for (auto &&[name, command] : document.definitions()) {
    Json::Value entry(Json::objectValue);
    entry["name"]       = command.name;
    entry["span"]       = span(command.span);
    entry["arg_spec"]   = command.arg_spec;
    entry["definition"] = command.raw;
    if (command.body.has_value()) entry["body"] = command.body.value();
    commands[name] = entry;
  }
  value["usepackages"] = packages;
  value["newcommands"] = commands;
  if (!document.failures().empty()) {
    Json::Value failures(Json::arrayValue);
    for (auto &&failure : document.failures()) failures.append(failure.str());
    value["failures"] = failures;
  }
  return value;
}

namespace render {
std::optional<format_t> parse_format(std::string_view name) {
  if (name == "txt") return format_t::txt;
  if (name == "json") return format_t::json;
  if (name == "yaml") return format_t::yaml;
  if (name == "list") return format_t::list;
  return std::nullopt;
}

std::string text(const depgraph::tree_t &tree) {
  std::string out = tree.key + "\n";
  draw(tree, "", out);
  return out;
}

Json::Value json(const depgraph::tree_t &tree) {
  Json::Value value(Json::objectValue);
  value[tree.key] = members(tree);
  return value;
}

std::optional<depgraph::tree_t> from_json(const Json::Value &value) {
  if (!value.isObject() || value.size() != 1) return std::nullopt;
  const std::string key = value.getMemberNames().front();
  return unfold(key, value[key]);
}

std::string dump(const Json::Value &value) {
  Json::StreamWriterBuilder builder;
  builder["indentation"] = "    ";
  return Json::writeString(builder, value) + "\n";
}

std::optional<Json::Value> load(std::string_view text) {
  Json::CharReaderBuilder builder;
  std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
  Json::Value value;
  std::string errors;
  if (!reader->parse(text.data(), text.data() + text.size(), &value, &errors)) {
    jot::warn("render: invalid json: {}", errors);
    return std::nullopt;
  }
  return value;
}

std::string yaml(const depgraph::tree_t &tree) {
  YAML::Emitter out;
  out << YAML::BeginMap << YAML::Key << tree.key << YAML::Value;
  emit(out, tree);
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

std::string list(const std::vector<path_t> &files) {
  std::string out;
  for (auto &&file : files) fmt::format_to(out_t(out), "{}\n", file.string());
  return out;
}

std::string outline(const depgraph::dep_t &dep, const std::optional<path_t> &base) {
  std::string out;
  std::vector<const depgraph::dep_t *> stack;
  ::outline(dep, 0, base, stack, out);
  return out;
}

std::string files_text(const project_t &project) {
  std::string out;
  for (auto &&document : by_file_name(project)) {
    line(out, 0, fmt::format("{}:", document->path().string()));
    line(out, 1, "usepackages:");
    for (auto &&[_, package] : document->imports()) line(out, 2, package.str());
    line(out, 1, "newcommands:");
    for (auto &&[_, command] : document->definitions()) line(out, 2, command.str());
    if (!document->failures().empty()) {
      line(out, 1, "failures:");
      for (auto &&failure : document->failures()) line(out, 2, failure.str());
    }
  }
  return out;
}

Json::Value files_json(const project_t &project) {
  Json::Value value(Json::objectValue);
  for (auto &&document : by_file_name(project)) value[document->path().string()] = document_json(*document);
  return value;
}

std::string files_yaml(const project_t &project) {
  YAML::Emitter out;
  out << YAML::BeginMap;
  for (auto &&document : by_file_name(project)) {
    out << YAML::Key << document->path().string() << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "usepackages" << YAML::Value << YAML::BeginMap;
    for (auto &&[name, package] : document->imports()) {
      out << YAML::Key << name << YAML::Value << YAML::BeginMap;
      out << YAML::Key << "span" << YAML::Value << YAML::Flow << YAML::BeginSeq << package.span.begin
          << package.span.end << YAML::EndSeq;
      if (package.options.has_value()) out << YAML::Key << "options" << YAML::Value << package.options.value();
      out << YAML::EndMap;
    }
    out << YAML::EndMap;
    out << YAML::Key << "newcommands" << YAML::Value << YAML::BeginMap;
    for (auto &&[name, command] : document->definitions()) {
      out << YAML::Key << name << YAML::Value << YAML::BeginMap;
      out << YAML::Key << "span" << YAML::Value << YAML::Flow << YAML::BeginSeq << command.span.begin
          << command.span.end << YAML::EndSeq;
      out << YAML::Key << "definition" << YAML::Value << command.raw;
      out << YAML::EndMap;
    }
    out << YAML::EndMap;
    if (!document->failures().empty()) {
      out << YAML::Key << "failures" << YAML::Value << YAML::BeginSeq;
      for (auto &&failure : document->failures()) out << failure.str();
      out << YAML::EndSeq;
    }
    out << YAML::EndMap;
  }
  out << YAML::EndMap;
  return std::string(out.c_str()) + "\n";
}

std::string commands(const project_t &project) {
  std::string out;
  for (auto &&location : project.locations()) {
    const auto &command = *location.definition;
    std::string definition = command.raw;
    std::replace(definition.begin(), definition.end(), '\n', ' ');
    line(out, 0, command.name);
    line(out, 1, fmt::format("definition: {}", definition));
    line(out, 1, fmt::format("span: ({}, {})", command.span.begin, command.span.end));
    line(out, 1, fmt::format("file: {}", location.document->path().string()));
  }
  return out;
}

std::optional<const depgraph::dep_t *> lookup(const project_t &project, std::string_view name) {
  const auto &by_name = project.documents_by_name();
  const auto &graph   = project.dependency_graph();
  auto node = [&](const std::string &key) -> std::optional<const depgraph::dep_t *> {
    const depgraph::dep_t *found = graph.find(key);
    if (found == nullptr) return std::nullopt;
    return found;
  };
  const std::string key(name);
  if (by_name.contains(key)) return node(key);
  const path_t path(key);
  for (auto &&[document_name, document] : by_name)
    if (document->path() == path) return node(document_name);
  for (auto &&[document_name, document] : by_name)
    if (document->path().filename() == path.filename()) return node(document_name);
  return std::nullopt;
}
} // namespace render

#include <project.hpp>

#include <fmt/format.h>
#include <jot.hpp>

static std::vector<std::unique_ptr<document_t>> load(const std::vector<std::filesystem::path> &paths) {
  std::vector<std::unique_ptr<document_t>> documents;
  for (auto &&path : paths) {
    if (!std::filesystem::is_regular_file(path)) {
      throw error::error_t(error::kind_t::not_found, fmt::format("No such file or directory: {}", path.string()),
                           path);
    }
    documents.push_back(std::make_unique<document_t>(path));
  }
  return documents;
}

project_t::project_t(const std::vector<std::filesystem::path> &paths) : _documents(load(paths)) {}
project_t::project_t(std::vector<std::unique_ptr<document_t>> documents) : _documents(std::move(documents)) {}

std::vector<const document_t *> project_t::documents(void) const {
  std::vector<const document_t *> out;
  out.reserve(this->_documents.size());
  for (auto &&document : this->_documents) out.push_back(document.get());
  return out;
}

const std::map<std::string, const document_t *> &project_t::documents_by_name(void) const {
  if (this->by_name.has_value()) return this->by_name.value();
  std::map<std::string, const document_t *> names;
  for (auto &&document : this->_documents) {
    auto [it, inserted] = names.insert_or_assign(document->name(), document.get());
    if (!inserted) jot::warn("duplicate document name `{}`, using `{}`", it->first, document->path().string());
  }
  this->by_name = std::move(names);
  return this->by_name.value();
}

const depgraph::graph_t &project_t::dependency_graph(void) const {
  if (!this->graph.has_value()) this->graph.emplace(depgraph::resolve(this->documents(), this->documents_by_name()));
  return this->graph.value();
}

std::vector<const document_t *> project_t::dependency_files(void) const {
  std::vector<const document_t *> out;
  const auto &names = this->documents_by_name();
  for (auto &&[name, _] : this->dependencies().targets()) out.push_back(names.at(name));
  return out;
}

const locations::index_t &project_t::locations_by_name(void) const {
  if (!this->index.has_value()) this->index = locations::build(this->documents());
  return this->index.value();
}

const std::vector<locations::location_t> &project_t::locations(void) const {
  if (!this->ordered.has_value()) this->ordered = locations::sorted(this->locations_by_name());
  return this->ordered.value();
}

#ifndef PROJECT_HPP
#define PROJECT_HPP

#pragma once

#include <depgraph.hpp>
#include <document.hpp>
#include <filesystem>
#include <locations.hpp>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// The documents of one LaTeX compilation and what is derived from them. Every
// derived view is computed on first use and kept for the life of the project;
// the files are assumed not to change meanwhile.
class project_t {
private:
  std::vector<std::unique_ptr<document_t>> _documents;
  mutable std::optional<std::map<std::string, const document_t *>> by_name;
  mutable std::optional<depgraph::graph_t> graph;
  mutable std::optional<locations::index_t> index;
  mutable std::optional<std::vector<locations::location_t>> ordered;

public:
  // throws error::error_t (not found) for a path that is not a regular file
  explicit project_t(const std::vector<std::filesystem::path> &paths);
  explicit project_t(std::vector<std::unique_ptr<document_t>> documents);

  std::vector<const document_t *> documents(void) const;
  // documents by file name; of two documents with one name the later wins
  const std::map<std::string, const document_t *> &documents_by_name(void) const;
  const depgraph::graph_t &dependency_graph(void) const;
  // the synthetic root of the dependency graph
  const depgraph::dep_t &dependencies(void) const { return this->dependency_graph().root(); }
  // documents that are targets of the root
  std::vector<const document_t *> dependency_files(void) const;
  const locations::index_t &locations_by_name(void) const;
  const std::vector<locations::location_t> &locations(void) const;
  // computes the dependency graph ahead of use
  void prime(void) const { this->dependency_graph(); }
};

#endif

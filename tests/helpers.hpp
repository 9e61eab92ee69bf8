#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#pragma once

#include <document.hpp>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <memory>
#include <string>
#include <utility>
#include <vector>

static const std::filesystem::path RESOURCES = TEXDEPS_TEST_RESOURCES;

// scratch directory removed with the object
struct tmpdir_t {
  std::filesystem::path path;

  explicit tmpdir_t(const std::string &name) : path(std::filesystem::temp_directory_path() / name) {
    std::filesystem::remove_all(this->path);
    std::filesystem::create_directories(this->path);
  }
  ~tmpdir_t() {
    std::error_code ec;
    std::filesystem::remove_all(this->path, ec);
  }
  tmpdir_t(const tmpdir_t &)            = delete;
  tmpdir_t &operator=(const tmpdir_t &) = delete;

  std::filesystem::path write(const std::filesystem::path &relative, const std::string &text) const {
    const auto file = this->path / relative;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream out(file, std::ios::binary);
    out << text;
    return file;
  }
};

// in memory documents, in order
inline std::vector<std::unique_ptr<document_t>>
documents(std::initializer_list<std::pair<std::filesystem::path, std::string>> sources) {
  std::vector<std::unique_ptr<document_t>> out;
  for (auto &&[path, text] : sources) out.push_back(std::make_unique<document_t>(path, text));
  return out;
}

#endif

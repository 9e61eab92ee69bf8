#ifndef DOCUMENT_HPP
#define DOCUMENT_HPP

#pragma once

#include <error.hpp>
#include <extract.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

// A LaTeX file (.tex, .sty, ...) with its parsed imports and definitions.
// The text is read on first use and kept; imports, definitions and failures
// come from one extraction pass that runs on first use of any of them.
class document_t {
private:
  std::filesystem::path _path;
  mutable std::optional<std::string> _text;
  mutable std::optional<extract::result_t> parsed;

  const extract::result_t &extracted(void) const;

public:
  explicit document_t(std::filesystem::path path);
  // in memory document; `path` only names it
  document_t(std::filesystem::path path, std::string text);
  document_t(const document_t &)            = delete;
  document_t &operator=(const document_t &) = delete;

  const std::filesystem::path &path(void) const { return this->_path; }
  // file name of the path, the key imports resolve against
  std::string name(void) const { return this->_path.filename().string(); }
  // throws error::error_t (io) when the file cannot be read
  const std::string &text(void) const;
  const extract::imports_t &imports(void) const { return this->extracted().imports; }
  const extract::definitions_t &definitions(void) const { return this->extracted().definitions; }
  const std::vector<error::failure_t> &failures(void) const { return this->extracted().failures; }
};

#endif

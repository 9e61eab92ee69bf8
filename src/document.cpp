#include <document.hpp>

#include <fmt/format.h>
#include <fstream>
#include <jot.hpp>
#include <latex.hpp>

document_t::document_t(std::filesystem::path path) : _path(std::move(path)) {}
document_t::document_t(std::filesystem::path path, std::string text)
  : _path(std::move(path)), _text(std::move(text)) {}

const std::string &document_t::text(void) const {
  if (this->_text.has_value()) return this->_text.value();
  jot::debug("reading: `{}`", this->_path.string());
  std::error_code code;
  const u64 size = std::filesystem::file_size(this->_path, code);
  if (code) {
    throw error::error_t(error::kind_t::io, fmt::format("cannot read `{}`: {}", this->_path.string(), code.message()),
                         this->_path);
  }
  std::string content(size, '\0');
  {
    std::ifstream input(this->_path, std::ios::binary);
    if (!input.read(content.data(), static_cast<std::streamsize>(size))) {
      throw error::error_t(error::kind_t::io, fmt::format("cannot read `{}`", this->_path.string()), this->_path);
    }
  }
  this->_text = std::move(content);
  return this->_text.value();
}

const extract::result_t &document_t::extracted(void) const {
  if (this->parsed.has_value()) return this->parsed.value();
  const std::string &text = this->text();
  const auto nodes        = latex::parse(text);
  this->parsed            = extract::run(nodes, text, this->_path);
  return this->parsed.value();
}

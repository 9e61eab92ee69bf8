#ifndef ERROR_HPP
#define ERROR_HPP

#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <types.hpp>

namespace error {
enum class kind_t : u8 { parse, not_found, io, lookup };

std::string_view kind_name(kind_t kind);

// fatal for the operation that raised it; the cli reports it and exits
class error_t : public std::runtime_error {
private:
  kind_t _kind;
  std::filesystem::path _path;

public:
  error_t(kind_t kind, const std::string &message, std::filesystem::path path = {});
  kind_t kind(void) const noexcept { return this->_kind; }
  const std::filesystem::path &path(void) const noexcept { return this->_path; }
};

// a recorded, non-fatal problem found while scanning a document
struct failure_t {
  kind_t kind;
  std::filesystem::path path;
  std::string message;
  u64 offset;

  std::string str(void) const;
};
} // namespace error

#endif

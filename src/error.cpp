#include <error.hpp>

#include <fmt/format.h>

namespace error {
std::string_view kind_name(kind_t kind) {
  switch (kind) {
  case kind_t::parse: return "parse";
  case kind_t::not_found: return "not found";
  case kind_t::io: return "io";
  case kind_t::lookup: return "lookup";
  }
  return "unknown";
}

error_t::error_t(kind_t kind, const std::string &message, std::filesystem::path path)
  : std::runtime_error(message), _kind(kind), _path(std::move(path)) {}

std::string failure_t::str(void) const { return fmt::format("{} in '{}'", this->message, this->path.string()); }
} // namespace error

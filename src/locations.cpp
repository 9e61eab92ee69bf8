#include <locations.hpp>

#include <fmt/format.h>
#include <jot.hpp>

namespace locations {
std::string location_t::str(void) const {
  return fmt::format("{}: {}", this->definition->str(), this->document->name());
}

index_t build(const std::vector<const document_t *> &documents) {
  index_t index;
  for (auto &&document : documents) {
    for (auto &&[name, definition] : document->definitions()) {
      location_t location{ &definition, document };
      auto [it, inserted] = index.insert_or_assign(name, location);
      if (!inserted) jot::debug("locations: `{}` now from `{}`", name, document->path().string());
    }
  }
  return index;
}

std::vector<location_t> sorted(const index_t &index) {
  std::vector<location_t> out;
  out.reserve(index.size());
  for (auto &&[_, location] : index) out.push_back(location);
  return out;
}
} // namespace locations

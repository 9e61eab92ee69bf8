#ifndef LOCATIONS_HPP
#define LOCATIONS_HPP

#pragma once

#include <document.hpp>
#include <extract.hpp>
#include <map>
#include <string>
#include <vector>

namespace locations {
// a macro definition and the document it lives in
struct location_t {
  const extract::newcommand_t *definition;
  const document_t *document;

  std::string str(void) const;
};

typedef std::map<std::string, location_t> index_t;

// every definition of `documents` by macro name; a name defined in several
// documents maps to the one processed last
index_t build(const std::vector<const document_t *> &documents);
// `index` ordered by macro name
std::vector<location_t> sorted(const index_t &index);
} // namespace locations

#endif

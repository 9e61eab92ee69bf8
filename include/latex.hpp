#ifndef LATEX_HPP
#define LATEX_HPP

#pragma once

#include <string>
#include <string_view>
#include <types.hpp>
#include <variant>
#include <vector>

namespace latex {
struct node_t;

// `\name` plus the whitespace that follows a letter macro
struct macro_t {
  std::string name;
  u64 offset, length;
};
// `{...}` including both braces
struct group_t {
  std::vector<node_t> children;
  u64 offset, length;
};
struct chars_t {
  std::string text;
  u64 offset, length;
};
// `%...` through the newline, or a whole comment environment
struct comment_t {
  u64 offset, length;
};

enum class kind_t : u8 { macro, group, chars, comment };

struct node_t {
  std::variant<macro_t, group_t, chars_t, comment_t> value;

  kind_t kind(void) const { return static_cast<kind_t>(this->value.index()); }
  u64 offset(void) const;
  u64 length(void) const;
  u64 end(void) const { return this->offset() + this->length(); }
  template <typename T>
  const T *as(void) const {
    return std::get_if<T>(&this->value);
  }
};

std::string_view kind_name(kind_t kind);

// top level node sequence of `text`; never fails, malformed input degrades to
// character runs
std::vector<node_t> parse(std::string_view text);

// exact source slice of `node`
std::string_view verbatim(std::string_view text, const node_t &node);
} // namespace latex

#endif

#ifndef JOT_HPP
#define JOT_HPP

#pragma once

#include <cstdlib>
#include <fmt/color.h>
#include <fmt/format.h>
#include <optional>
#include <string_view>
#include <types.hpp>

namespace jot {
enum class level_t : u8 { debug, info, warn, error, fatal };

void threshold(level_t level);
level_t threshold(void);
bool enabled(level_t level);
std::optional<level_t> parse_level(std::string_view name);
std::string_view level_name(level_t level);

// writes one prefixed line to stderr under the jot lock
void emit(level_t level, std::string_view message);

template <typename... T>
void debug(fmt::format_string<T...> message, T &&...args) {
  if (!enabled(level_t::debug)) return;
  emit(level_t::debug, fmt::format(message, std::forward<T>(args)...));
}
template <typename... T>
void info(fmt::format_string<T...> message, T &&...args) {
  if (!enabled(level_t::info)) return;
  emit(level_t::info, fmt::format(message, std::forward<T>(args)...));
}
template <typename... T>
void warn(fmt::format_string<T...> message, T &&...args) {
  if (!enabled(level_t::warn)) return;
  emit(level_t::warn, fmt::format(message, std::forward<T>(args)...));
}
template <typename... T>
void error(fmt::format_string<T...> message, T &&...args) {
  if (!enabled(level_t::error)) return;
  emit(level_t::error, fmt::format(message, std::forward<T>(args)...));
}
template <typename... T>
void fatal(fmt::format_string<T...> message, T &&...args) {
  emit(level_t::fatal, fmt::format(message, std::forward<T>(args)...));
}
} // namespace jot

#define die(...)                                                                                                       \
  do {                                                                                                                 \
    jot::fatal(__VA_ARGS__);                                                                                           \
    std::exit(1);                                                                                                      \
  } while (0)

#endif

#include <jot.hpp>

#include <atomic>
#include <mutex>

static std::atomic<jot::level_t> current{ jot::level_t::warn };
static std::mutex lock;

static constexpr std::string_view NAMES[] = { "debug", "info", "warn", "error", "fatal" };

namespace jot {
void threshold(level_t level) { current.store(level); }
level_t threshold(void) { return current.load(); }
bool enabled(level_t level) { return level >= current.load(); }

std::optional<level_t> parse_level(std::string_view name) {
  for (u8 i = 0; i < sizeof(NAMES) / sizeof(*NAMES); i++)
    if (NAMES[i] == name) return static_cast<level_t>(i);
  return std::nullopt;
}
std::string_view level_name(level_t level) { return NAMES[static_cast<u8>(level)]; }

void emit(level_t level, std::string_view message) {
  static constexpr auto debug = fmt::styled("DEBUG", fmt::fg(fmt::rgb(0x9e9e9e)));
  static constexpr auto info  = fmt::styled("INFO", fmt::fg(fmt::rgb(0x4fc3f7)));
  static constexpr auto warn  = fmt::styled("WARN", fmt::fg(fmt::rgb(0xffa000)) | fmt::emphasis::bold);
  static constexpr auto error =
    fmt::styled("ERROR", fmt::fg(fmt::rgb(0xe53935)) | fmt::emphasis::bold | fmt::emphasis::underline);
  static constexpr auto fatal =
    fmt::styled("FATAL", fmt::fg(fmt::rgb(0x6a1b9a)) | fmt::emphasis::bold | fmt::emphasis::underline);
  std::lock_guard<std::mutex> guard(lock);
  switch (level) {
  case level_t::debug: fmt::print(stderr, "[{}] {}\n", debug, message); break;
  case level_t::info: fmt::print(stderr, "[{}] {}\n", info, message); break;
  case level_t::warn: fmt::print(stderr, "[{}] {}\n", warn, message); break;
  case level_t::error: fmt::print(stderr, "[{}] {}\n", error, message); break;
  case level_t::fatal: fmt::print(stderr, "[{}] {}\n", fatal, message); break;
  }
}
} // namespace jot

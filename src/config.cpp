#include <config.hpp>

#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

static config::load_t build(const YAML::Node &root, const std::filesystem::path &source) {
  config::config_t settings;
  settings.source = source;
  if (!root || root.IsNull()) return config::load_t::ok(std::move(settings));
  if (!root.IsMap()) return config::load_t::fail("configuration must be a map");

  if (const auto files = root["scan"]) {
    if (!files.IsMap()) return config::load_t::fail("scan must be a map");
    if (const auto extensions = files["extensions"]) {
      if (!extensions.IsSequence()) return config::load_t::fail("scan.extensions must be a list");
      settings.scan.extensions.clear();
      for (const auto &extension : extensions) {
        std::string value = extension.as<std::string>();
        if (!value.empty() && value.front() == '.') value.erase(0, 1);
        settings.scan.extensions.insert(value);
      }
    }
    if (const auto recurse = files["recurse"]) settings.scan.recurse = recurse.as<bool>();
  }

  if (const auto log = root["log"]) {
    if (!log.IsMap()) return config::load_t::fail("log must be a map");
    if (const auto level = log["level"]) {
      const std::string name = level.as<std::string>();
      auto parsed            = jot::parse_level(name);
      if (!parsed.has_value()) return config::load_t::fail(fmt::format("invalid log.level: '{}'", name));
      settings.level = parsed.value();
    }
  }
  return config::load_t::ok(std::move(settings));
}

namespace config {
load_t parse(std::string_view text, const std::filesystem::path &source) {
  try {
    return build(YAML::Load(std::string(text)), source);
  } catch (const YAML::Exception &e) {
    return load_t::fail(fmt::format("failed to parse YAML: {}", e.what()));
  }
}

load_t load(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path))
    return load_t::fail(fmt::format("configuration file not found: {}", path.string()));
  try {
    return build(YAML::LoadFile(path.string()), path);
  } catch (const YAML::Exception &e) {
    return load_t::fail(fmt::format("failed to parse YAML: {}", e.what()));
  }
}

std::optional<std::filesystem::path> find(const std::filesystem::path &start) {
  std::filesystem::path current = std::filesystem::absolute(start);
  if (std::filesystem::is_regular_file(current)) current = current.parent_path();
  while (true) {
    std::filesystem::path candidate = current / FILE_NAME;
    if (std::filesystem::exists(candidate)) return candidate;
    const std::filesystem::path parent = current.parent_path();
    if (parent == current) break;
    current = parent;
  }
  return std::nullopt;
}
} // namespace config

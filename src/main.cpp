#include <config.hpp>
#include <cstdio>
#include <depgraph.hpp>
#include <error.hpp>
#include <filesystem>
#include <fmt/color.h>
#include <fmt/format.h>
#include <jot.hpp>
#include <optional>
#include <project.hpp>
#include <render.hpp>
#include <scan.hpp>
#include <string>
#include <string_view>
#include <vector>

typedef std::filesystem::path path_t;

struct args_t {
  std::string command;
  std::string paths;
  std::optional<std::string> source;
  std::optional<path_t> config;
  std::optional<jot::level_t> level;
  render::format_t format = render::format_t::txt;
  bool relative           = false;
  bool help               = false;
};

void welcome(void);
void usage(const char *program);
args_t parse(int argc, char *argv[]);
config::config_t configure(const args_t &args);
project_t load_project(const args_t &args, const config::config_t &settings);

void deps(const args_t &args, const project_t &project);
void outline(const args_t &args, const project_t &project);
void files(const args_t &args, const project_t &project);
void commands(const project_t &project);

int main(int argc, char *argv[]) {
  std::setbuf(stderr, nullptr);
  args_t args = parse(argc, argv);
  if (args.help || args.command.empty()) {
    usage(argv[0]);
    return args.help ? 0 : 1;
  }
  const auto settings = configure(args);
  try {
    project_t project = load_project(args, settings);
    if (args.command == "deps") {
      deps(args, project);
    } else if (args.command == "outline") {
      outline(args, project);
    } else if (args.command == "files") {
      files(args, project);
    } else if (args.command == "commands") {
      commands(project);
    } else {
      usage(argv[0]);
      return 1;
    }
  } catch (const error::error_t &e) {
    die("{}", e.what());
  } catch (const std::filesystem::filesystem_error &e) {
    die("{}", e.what());
  }
  return 0;
}

void welcome(void) {
  static constexpr auto style1  = fmt::emphasis::bold;
  static constexpr auto style2  = fmt::fg(fmt::rgb(0x2962ff)) | fmt::emphasis::bold;
  static constexpr auto tex     = fmt::styled("TeX", style2);
  static constexpr auto deps    = fmt::styled("deps", style1);
  static constexpr auto version = "1.0";
  fmt::print(stderr, "{}{} v{}\n", tex, deps, version);
}

void usage(const char *program) {
  welcome();
  fmt::print(stderr,
             "\nUsage: {} <command> [options] <paths>\n\n"
             "Commands:\n"
             "  deps       dependency tree of the project (or of one source)\n"
             "  outline    dependency outline with orphaned imports\n"
             "  files      imports, definitions and failures per file\n"
             "  commands   macro definitions and where they live\n\n"
             "Options:\n"
             "  -f, --format <fmt>   txt, json, yaml or list\n"
             "  -s, --source <name>  start the tree at this document\n"
             "  -r, --relative       show paths relative to the common base\n"
             "  -c, --config <file>  configuration file (default: nearest {})\n"
             "  -v, --verbose        info messages\n"
             "  -d, --debug          debug messages\n"
             "  -q, --quiet          errors only\n"
             "  -h, --help           show this help message\n\n"
             "<paths> is a `:` separated list of files and directories.\n",
             program, config::FILE_NAME);
}

args_t parse(int argc, char *argv[]) {
  args_t args;
  if (argc < 2) return args;
  args.command = argv[1];
  if (args.command == "-h" || args.command == "--help") args.help = true;
  for (int i = 2; i < argc; i++) {
    const std::string_view arg = argv[i];
    const bool more            = i + 1 < argc;
    if ((arg == "-f" || arg == "--format") && more) {
      const auto format = render::parse_format(argv[++i]);
      if (!format.has_value()) die("unknown format `{}`", argv[i]);
      args.format = format.value();
    } else if ((arg == "-s" || arg == "--source") && more) {
      args.source = argv[++i];
    } else if ((arg == "-c" || arg == "--config") && more) {
      args.config = path_t(argv[++i]);
    } else if (arg == "-r" || arg == "--relative") {
      args.relative = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.level = jot::level_t::info;
    } else if (arg == "-d" || arg == "--debug") {
      args.level = jot::level_t::debug;
    } else if (arg == "-q" || arg == "--quiet") {
      args.level = jot::level_t::error;
    } else if (arg == "-h" || arg == "--help") {
      args.help = true;
    } else if (!arg.empty() && arg.front() == '-') {
      die("unknown option `{}`", arg);
    } else {
      if (!args.paths.empty()) args.paths += ':';
      args.paths += arg;
    }
  }
  if (args.paths.empty()) args.paths = ".";
  return args;
}

config::config_t configure(const args_t &args) {
  std::optional<path_t> file = args.config;
  if (!file.has_value()) {
    const auto paths = scan::split(args.paths);
    if (!paths.empty()) file = config::find(paths.front());
  }
  config::config_t settings;
  if (file.has_value()) {
    auto loaded = config::load(file.value());
    if (!loaded.success) die("{}", loaded.error);
    settings = std::move(loaded.config);
  }
  jot::threshold(args.level.value_or(settings.level));
  if (file.has_value()) jot::debug("configuration from `{}`", file->string());
  return settings;
}

project_t load_project(const args_t &args, const config::config_t &settings) {
  const auto candidates = scan::candidates(scan::split(args.paths), settings.scan);
  jot::info("parsing {} files", candidates.size());
  return project_t(candidates);
}

static const depgraph::dep_t &pick(const args_t &args, const project_t &project) {
  const depgraph::dep_t &root = project.dependencies();
  if (!args.source.has_value()) return root;
  auto found = render::lookup(project, args.source.value());
  if (!found.has_value()) throw error::error_t(error::kind_t::lookup, fmt::format("No source found: {}", *args.source));
  return *found.value();
}

static std::optional<path_t> base(const args_t &args, const depgraph::dep_t &dep) {
  if (!args.relative) return std::nullopt;
  return dep.is_root() ? depgraph::common_base(dep.files()) : dep.base_dir();
}

void deps(const args_t &args, const project_t &project) {
  const depgraph::dep_t &dep = pick(args, project);
  if (args.format == render::format_t::list) {
    fmt::print("{}", render::list(dep.files()));
    return;
  }
  const auto tree = dep.tree(base(args, dep));
  switch (args.format) {
  case render::format_t::txt: fmt::print("{}", render::text(tree)); break;
  case render::format_t::json: fmt::print("{}", render::dump(render::json(tree))); break;
  case render::format_t::yaml: fmt::print("{}", render::yaml(tree)); break;
  case render::format_t::list: break;
  }
  if (project.dependency_graph().cycles()) jot::info("{} import cycles", project.dependency_graph().cycles());
}

void outline(const args_t &args, const project_t &project) {
  const depgraph::dep_t &dep = pick(args, project);
  fmt::print("{}", render::outline(dep, base(args, dep)));
}

void files(const args_t &args, const project_t &project) {
  switch (args.format) {
  case render::format_t::txt: fmt::print("{}", render::files_text(project)); break;
  case render::format_t::json: fmt::print("{}", render::dump(render::files_json(project))); break;
  case render::format_t::yaml: fmt::print("{}", render::files_yaml(project)); break;
  case render::format_t::list:
    for (auto &&document : project.documents()) fmt::print("{}\n", document->path().string());
    break;
  }
  for (auto &&document : project.documents())
    for (auto &&failure : document->failures()) jot::warn("{}", failure.str());
}

void commands(const project_t &project) { fmt::print("{}", render::commands(project)); }

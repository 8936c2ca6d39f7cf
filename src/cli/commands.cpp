#include "liteagent/cli/commands.hpp"

#include "liteagent/common/fs.hpp"
#include "liteagent/config/config.hpp"
#include "liteagent/observability/factory.hpp"
#include "liteagent/observability/global.hpp"
#include "liteagent/sandbox/driver.hpp"
#include "liteagent/sandbox/engine.hpp"
#include "liteagent/sandbox/factory.hpp"
#include "liteagent/sandbox/templates.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

namespace liteagent::cli {

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_SANDBOX_FAILURE = 1;
constexpr int EXIT_USAGE = 2;

std::string version_string() {
#ifdef LITEAGENT_VERSION
  std::string version = LITEAGENT_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "liteagent-sandbox " + version;
}

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

/// Loads and validates the config and installs the configured observer.
common::Result<config::Config> load_validated_config() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    return cfg;
  }
  auto warnings = config::validate_config(cfg.value());
  if (!warnings.ok()) {
    return common::Result<config::Config>::failure(warnings.status());
  }
  observability::set_global_observer(observability::create_observer(cfg.value()));
  for (const auto &warning : warnings.value()) {
    observability::record_warning("config", warning);
  }
  return cfg;
}

/// Fresh empty directory used as the source tree when none is given.
class ScratchWorkspace {
public:
  ScratchWorkspace() {
    std::error_code ec;
    const auto root = std::filesystem::temp_directory_path(ec);
    if (ec) {
      return;
    }
    const auto candidate = root / ("liteagent_workspace_" + common::random_hex(8));
    if (std::filesystem::create_directory(candidate, ec)) {
      path_ = candidate;
    }
  }

  ~ScratchWorkspace() {
    if (!path_.empty()) {
      std::error_code ec;
      std::filesystem::remove_all(path_, ec);
    }
  }

  ScratchWorkspace(const ScratchWorkspace &) = delete;
  ScratchWorkspace &operator=(const ScratchWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

int run_run(std::vector<std::string> args) {
  std::string source;
  std::string engine_name;
  std::string template_name;
  std::string file;
  std::string code;
  std::vector<std::string> assignments;

  (void)take_option(args, "--source", "-s", source);
  (void)take_option(args, "--engine", "-e", engine_name);
  (void)take_option(args, "--template", "-t", template_name);
  const bool has_file = take_option(args, "--file", "-f", file);
  const bool has_code = take_option(args, "--code", "-c", code);
  std::string assignment;
  while (take_option(args, "--set", "", assignment)) {
    assignments.push_back(assignment);
  }

  if (!args.empty()) {
    std::cerr << "Unknown argument for run: " << args.front() << "\n";
    return EXIT_USAGE;
  }
  if (has_file == has_code) {
    std::cerr << "run requires exactly one of --file PATH or --code TEXT\n";
    return EXIT_USAGE;
  }

  auto cfg = load_validated_config();
  if (!cfg.ok()) {
    std::cerr << common::error_kind_to_string(cfg.kind()) << " error: " << cfg.error() << "\n";
    return EXIT_USAGE;
  }
  const auto &settings = cfg.value();

  auto engine = sandbox::parse_engine_kind(engine_name.empty() ? settings.container.engine
                                                               : engine_name);
  if (!engine.ok()) {
    std::cerr << engine.error() << "\n";
    return EXIT_USAGE;
  }

  auto overrides = config::session_overrides(settings);
  if (!overrides.ok()) {
    std::cerr << overrides.error() << "\n";
    return EXIT_USAGE;
  }
  for (const auto &item : assignments) {
    if (auto parsed = sandbox::parse_override_assignment(overrides.value(), item); !parsed.ok()) {
      std::cerr << parsed.error() << "\n";
      return EXIT_USAGE;
    }
  }

  if (has_file) {
    auto text = common::read_text_file(common::expand_path(file));
    if (!text.ok()) {
      std::cerr << text.error() << "\n";
      return EXIT_USAGE;
    }
    code = text.value();
  }

  ScratchWorkspace scratch;
  std::filesystem::path source_dir;
  if (source.empty()) {
    if (scratch.path().empty()) {
      std::cerr << "Unable to create a temporary workspace\n";
      return EXIT_USAGE;
    }
    source_dir = scratch.path();
  } else {
    source_dir = common::expand_path(source);
  }

  const sandbox::ConfigurationFactory factory(config::runtime_settings(settings));
  const auto result = factory.run_code_once(
      source_dir, engine.value(),
      template_name.empty() ? settings.container.template_name : template_name, overrides.value(),
      code);

  std::cout << result.to_json() << "\n";
  return result.success ? EXIT_OK : EXIT_SANDBOX_FAILURE;
}

int run_templates() {
  for (const auto &tmpl : sandbox::templates::builtin_templates()) {
    std::string packages;
    for (const auto &package : tmpl.authorized_packages) {
      if (!packages.empty()) {
        packages.push_back(',');
      }
      packages += package;
    }
    std::cout << tmpl.name << "\n";
    std::cout << "  " << tmpl.description << "\n";
    std::cout << "  memory=" << tmpl.memory_limit
              << " cpus=" << sandbox::format_cpu_limit(tmpl.cpu_limit)
              << " timeout=" << tmpl.timeout_seconds << "s"
              << " network=" << (tmpl.network_enabled ? "on" : "off")
              << " fs=" << sandbox::filesystem_mode_to_string(tmpl.filesystem_mode) << "\n";
    std::cout << "  packages=" << (packages.empty() ? "-" : packages) << "\n";
  }
  return EXIT_OK;
}

int run_doctor() {
  int failed = 0;
  int warnings = 0;

  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cout << "[FAIL] Config load: " << cfg.error() << "\n";
    return EXIT_SANDBOX_FAILURE;
  }
  std::cout << "[PASS] Config load\n";

  auto validated = config::validate_config(cfg.value());
  if (!validated.ok()) {
    std::cout << "[FAIL] Config validation: " << validated.error() << "\n";
    ++failed;
  } else if (validated.value().empty()) {
    std::cout << "[PASS] Config validation\n";
  } else {
    for (const auto &warning : validated.value()) {
      std::cout << "[WARN] Config validation: " << warning << "\n";
      ++warnings;
    }
  }

  const auto configured = sandbox::parse_engine_kind(cfg.value().container.engine);
  sandbox::EngineCliRunner runner;
  for (const auto kind : {sandbox::EngineKind::Docker, sandbox::EngineKind::Podman}) {
    const auto driver = sandbox::make_driver(kind);
    const bool required = configured.ok() && configured.value() == kind;
    auto check = runner.run(driver->binary(), sandbox::build_version_args(),
                            sandbox::EngineCommandOptions{.allow_failure = true});
    if (check.ok() && check.value().exit_code == 0) {
      std::cout << "[PASS] Engine " << driver->binary() << ": "
                << common::trim(check.value().stdout_text) << "\n";
      continue;
    }
    const std::string detail = check.ok() ? common::trim(check.value().stderr_text) : check.error();
    if (required) {
      std::cout << "[FAIL] Engine " << driver->binary() << ": " << detail << "\n";
      ++failed;
    } else {
      std::cout << "[WARN] Engine " << driver->binary() << ": " << detail << "\n";
      ++warnings;
    }
  }

  std::error_code ec;
  const auto temp = std::filesystem::temp_directory_path(ec);
  if (ec) {
    std::cout << "[FAIL] Temp directory: " << ec.message() << "\n";
    ++failed;
  } else {
    std::cout << "[PASS] Temp directory: " << temp.string() << "\n";
  }

  std::cout << "Summary: " << failed << " failed, " << warnings << " warnings\n";
  return failed == 0 ? EXIT_OK : EXIT_SANDBOX_FAILURE;
}

int run_config(std::vector<std::string> args) {
  if (args.empty() || args[0] == "path") {
    auto path = config::config_path();
    if (!path.ok()) {
      std::cerr << path.error() << "\n";
      return EXIT_USAGE;
    }
    std::cout << path.value().string() << "\n";
    return EXIT_OK;
  }

  if (args[0] == "init") {
    const bool force = take_flag(args, "--force");
    if (config::config_exists() && !force) {
      std::cerr << "Config already exists; pass --force to overwrite\n";
      return EXIT_USAGE;
    }
    auto saved = config::save_config(config::Config{});
    if (!saved.ok()) {
      std::cerr << saved.error() << "\n";
      return EXIT_SANDBOX_FAILURE;
    }
    std::cout << "Wrote default config\n";
    return EXIT_OK;
  }

  if (args[0] == "show") {
    auto cfg = config::load_config();
    if (!cfg.ok()) {
      std::cerr << cfg.error() << "\n";
      return EXIT_USAGE;
    }
    const auto &container = cfg.value().container;
    std::cout << "engine = " << container.engine << "\n";
    std::cout << "template = " << container.template_name << "\n";
    std::cout << "image = " << container.image << "\n";
    std::cout << "workdir = " << container.workdir << "\n";
    std::cout << "interpreter = " << container.interpreter << "\n";
    std::cout << "package_manager = " << container.package_manager << "\n";
    std::cout << "name_prefix = " << container.name_prefix << "\n";
    for (const auto &[key, value] : cfg.value().overrides) {
      std::cout << "overrides." << key << " = " << value << "\n";
    }
    std::cout << "observability.backend = " << cfg.value().observability.backend << "\n";
    std::cout << "observability.log_level = " << cfg.value().observability.log_level << "\n";
    return EXIT_OK;
  }

  std::cerr << "Unknown config command: " << args[0] << "\n";
  return EXIT_USAGE;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "Usage: liteagent-sandbox [--config PATH] <command> [options]\n\n";
  std::cout << "Commands:\n";
  std::cout << "  run        Execute code in a fresh container session\n";
  std::cout << "             [--source DIR] [--engine docker|podman] [--template NAME]\n";
  std::cout << "             [--set key=value]... (--file PATH | --code TEXT)\n";
  std::cout << "  templates  List session templates\n";
  std::cout << "  doctor     Check configuration and container engines\n";
  std::cout << "  config     path | show | init [--force]\n";
  std::cout << "  version    Show version\n\n";
  std::cout << "Override keys:";
  for (const auto &key : sandbox::override_keys()) {
    std::cout << " " << key;
  }
  std::cout << "\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc - 1, argv + 1);
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return EXIT_USAGE;
  }

  if (args.empty()) {
    print_help();
    return EXIT_USAGE;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return EXIT_OK;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return EXIT_OK;
  }
  if (subcommand == "run") {
    return run_run(std::move(args));
  }
  if (subcommand == "templates") {
    return run_templates();
  }
  if (subcommand == "doctor") {
    return run_doctor();
  }
  if (subcommand == "config") {
    return run_config(std::move(args));
  }

  std::cerr << "Unknown command: " << subcommand << "\n";
  print_help();
  return EXIT_USAGE;
}

} // namespace liteagent::cli

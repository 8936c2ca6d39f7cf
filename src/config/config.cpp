#include "liteagent/config/config.hpp"

#include "liteagent/common/fs.hpp"
#include "liteagent/common/toml.hpp"
#include "liteagent/observability/factory.hpp"
#include "liteagent/sandbox/templates.hpp"

#include <cstdlib>
#include <sstream>

namespace liteagent::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".liteagent";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("LITEAGENT_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

/// TOML arrays become comma lists so they share the override parser with the CLI.
std::string override_text(const std::string &raw) {
  const std::string value = common::trim(raw);
  if (value.size() >= 2 && value.front() == '[' && value.back() == ']') {
    common::TomlDocument doc;
    doc.values["v"] = value;
    std::string joined;
    for (const auto &item : doc.get_string_array("v")) {
      if (!joined.empty()) {
        joined.push_back(',');
      }
      joined += item;
    }
    return joined;
  }
  return common::toml_unquote(value);
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    const auto parent = override_path->parent_path();
    return common::Result<std::filesystem::path>::success(
        parent.empty() ? std::filesystem::path(".") : parent);
  }
  auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error(), common::ErrorKind::Config);
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }
  auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  g_config_path_override = std::move(path);
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void apply_env_overrides(Config &config) {
  if (const char *engine = std::getenv("LITEAGENT_ENGINE"); engine != nullptr && *engine) {
    config.container.engine = engine;
  }
  if (const char *tmpl = std::getenv("LITEAGENT_TEMPLATE"); tmpl != nullptr && *tmpl) {
    config.container.template_name = tmpl;
  }
  if (const char *image = std::getenv("LITEAGENT_IMAGE"); image != nullptr && *image) {
    config.container.image = image;
  }
  if (const char *backend = std::getenv("LITEAGENT_LOG_BACKEND"); backend != nullptr && *backend) {
    config.observability.backend = backend;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error(), common::ErrorKind::Config);
  }
  const auto &doc = parsed.value();

  Config config;
  auto &container = config.container;
  container.engine = doc.get_string("container.engine", container.engine);
  container.template_name = doc.get_string("container.template", container.template_name);
  container.image = doc.get_string("container.image", container.image);
  container.workdir = doc.get_string("container.workdir", container.workdir);
  container.interpreter = doc.get_string("container.interpreter", container.interpreter);
  container.package_manager = doc.get_string("container.package_manager", container.package_manager);
  container.name_prefix = doc.get_string("container.name_prefix", container.name_prefix);
  if (doc.has("container.host_grace_seconds")) {
    const int grace = doc.get_int("container.host_grace_seconds", -1);
    if (grace < 0 || static_cast<std::uint32_t>(grace) > sandbox::MAX_HOST_GRACE_SECONDS) {
      return common::Result<Config>::failure("container.host_grace_seconds must be between 0 and " +
                                                 std::to_string(sandbox::MAX_HOST_GRACE_SECONDS),
                                             common::ErrorKind::Config);
    }
    container.host_grace_seconds = static_cast<std::uint32_t>(grace);
  }

  for (const auto &key : doc.section_keys("overrides")) {
    config.overrides[key] = override_text(doc.values.at("overrides." + key));
  }

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.log_level =
      doc.get_string("observability.log_level", config.observability.log_level);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error(), common::ErrorKind::Config);
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  auto text = common::read_text_file(path);
  if (!text.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string(),
                                           common::ErrorKind::Config);
  }

  auto config = parse_config(text.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error(),
                                           common::ErrorKind::Config);
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return path.status();
  }
  if (const auto parent = path.value().parent_path(); !parent.empty()) {
    auto dir = common::ensure_dir(parent);
    if (!dir.ok()) {
      return dir.status();
    }
  }

  std::ostringstream out;
  out << "[container]\n";
  out << "engine = " << common::quote_toml_string(config.container.engine) << "\n";
  out << "template = " << common::quote_toml_string(config.container.template_name) << "\n";
  out << "image = " << common::quote_toml_string(config.container.image) << "\n";
  out << "workdir = " << common::quote_toml_string(config.container.workdir) << "\n";
  out << "interpreter = " << common::quote_toml_string(config.container.interpreter) << "\n";
  out << "package_manager = " << common::quote_toml_string(config.container.package_manager)
      << "\n";
  out << "name_prefix = " << common::quote_toml_string(config.container.name_prefix) << "\n";
  out << "host_grace_seconds = " << config.container.host_grace_seconds << "\n";

  if (!config.overrides.empty()) {
    out << "\n[overrides]\n";
    for (const auto &[key, value] : config.overrides) {
      if (key == "authorized_packages" || key == "authorized_imports") {
        out << key << " = " << common::toml_string_array(sandbox::parse_package_list(value))
            << "\n";
      } else if (key == "network_enabled" || key == "read_only") {
        const std::string normalized = common::to_lower(common::trim(value));
        out << key << " = " << bool_to_toml(normalized == "true" || normalized == "1") << "\n";
      } else {
        out << key << " = " << common::quote_toml_string(value) << "\n";
      }
    }
  }

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "log_level = " << common::quote_toml_string(config.observability.log_level) << "\n";

  return common::write_text_file(path.value(), out.str());
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (!sandbox::parse_engine_kind(config.container.engine).ok()) {
    return common::Result<std::vector<std::string>>::failure(
        "Invalid container.engine: " + config.container.engine, common::ErrorKind::Config);
  }

  if (!sandbox::templates::is_known_template(config.container.template_name)) {
    warnings.push_back("container.template '" + config.container.template_name +
                       "' is not a known template; 'default' will be used");
  }

  if (common::trim(config.container.image).empty()) {
    return common::Result<std::vector<std::string>>::failure("container.image must not be empty",
                                                              common::ErrorKind::Config);
  }

  if (config.container.workdir.empty() || config.container.workdir.front() != '/') {
    return common::Result<std::vector<std::string>>::failure(
        "container.workdir must be an absolute path: " + config.container.workdir,
        common::ErrorKind::Config);
  }

  if (common::trim(config.container.interpreter).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "container.interpreter must not be empty", common::ErrorKind::Config);
  }

  if (common::trim(config.container.name_prefix).empty()) {
    return common::Result<std::vector<std::string>>::failure(
        "container.name_prefix must not be empty", common::ErrorKind::Config);
  }

  auto overrides = session_overrides(config);
  if (!overrides.ok()) {
    return common::Result<std::vector<std::string>>::failure(overrides.error(),
                                                              common::ErrorKind::Config);
  }

  if (!observability::is_known_backend(config.observability.backend)) {
    warnings.push_back("observability.backend '" + config.observability.backend +
                       "' is unknown; falling back to log");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

sandbox::RuntimeSettings runtime_settings(const Config &config) {
  sandbox::RuntimeSettings runtime;
  runtime.image = config.container.image;
  runtime.workdir = config.container.workdir;
  runtime.interpreter = config.container.interpreter;
  runtime.package_manager = config.container.package_manager;
  runtime.name_prefix = config.container.name_prefix;
  runtime.host_grace_seconds = config.container.host_grace_seconds;
  return runtime;
}

common::Result<sandbox::SessionOverrides> session_overrides(const Config &config) {
  sandbox::SessionOverrides overrides;
  for (const auto &[key, value] : config.overrides) {
    auto status = sandbox::parse_override(overrides, key, value);
    if (!status.ok()) {
      return common::Result<sandbox::SessionOverrides>::failure("overrides." + key + ": " +
                                                                    status.error(),
                                                                status.kind());
    }
  }
  return common::Result<sandbox::SessionOverrides>::success(std::move(overrides));
}

} // namespace liteagent::config

#include "liteagent/sandbox/templates.hpp"

#include "liteagent/common/fs.hpp"

namespace liteagent::sandbox::templates {

const std::vector<SessionTemplate> &builtin_templates() {
  static const std::vector<SessionTemplate> templates = {
      SessionTemplate{
          .name = "default",
          .description = "General purpose, offline, read-only workspace",
          .memory_limit = "1g",
          .cpu_limit = 1.0,
          .timeout_seconds = 30,
          .network_enabled = false,
          .filesystem_mode = FilesystemMode::ReadOnly,
          .authorized_packages = {"os", "sys", "json", "re", "collections", "datetime"},
      },
      SessionTemplate{
          .name = "secure",
          .description = "Tight limits and a minimal package allowlist",
          .memory_limit = "512m",
          .cpu_limit = 0.5,
          .timeout_seconds = 15,
          .network_enabled = false,
          .filesystem_mode = FilesystemMode::ReadOnly,
          .authorized_packages = {"json", "re", "collections"},
      },
      SessionTemplate{
          .name = "ml",
          .description = "Data and machine-learning workloads",
          .memory_limit = "4g",
          .cpu_limit = 2.0,
          .timeout_seconds = 120,
          .network_enabled = false,
          .filesystem_mode = FilesystemMode::ReadOnly,
          .authorized_packages = {"numpy", "pandas", "sklearn", "matplotlib"},
      },
      SessionTemplate{
          .name = "web",
          .description = "Network-enabled HTTP client work",
          .memory_limit = "2g",
          .cpu_limit = 1.0,
          .timeout_seconds = 60,
          .network_enabled = true,
          .filesystem_mode = FilesystemMode::ReadOnly,
          .authorized_packages = {"requests", "beautifulsoup4", "urllib3", "aiohttp"},
      },
  };
  return templates;
}

const SessionTemplate *find_template(std::string_view name) {
  const std::string normalized = common::to_lower(common::trim(std::string(name)));
  for (const auto &tmpl : builtin_templates()) {
    if (tmpl.name == normalized) {
      return &tmpl;
    }
  }
  return nullptr;
}

bool is_known_template(std::string_view name) { return find_template(name) != nullptr; }

SessionConfig to_session_config(const SessionTemplate &tmpl, const EngineKind engine,
                                const RuntimeSettings &runtime) {
  SessionConfig config;
  config.engine = engine;
  config.memory_limit = tmpl.memory_limit;
  config.cpu_limit = tmpl.cpu_limit;
  config.timeout_seconds = tmpl.timeout_seconds;
  config.network_enabled = tmpl.network_enabled;
  config.filesystem_mode = tmpl.filesystem_mode;
  config.authorized_packages = tmpl.authorized_packages;
  config.runtime = runtime;
  return config;
}

} // namespace liteagent::sandbox::templates

#pragma once

#include "liteagent/sandbox/session_config.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace liteagent::sandbox::templates {

inline constexpr std::string_view DEFAULT_TEMPLATE = "default";

/// Named bundle of resource and security defaults for a session.
struct SessionTemplate {
  std::string name;
  std::string description;
  std::string memory_limit;
  double cpu_limit = 1.0;
  std::uint32_t timeout_seconds = 30;
  bool network_enabled = false;
  FilesystemMode filesystem_mode = FilesystemMode::ReadOnly;
  std::vector<std::string> authorized_packages;
};

/// The closed template set, "default" first.
[[nodiscard]] const std::vector<SessionTemplate> &builtin_templates();

/// nullptr when `name` is not a known template.
[[nodiscard]] const SessionTemplate *find_template(std::string_view name);

[[nodiscard]] bool is_known_template(std::string_view name);

[[nodiscard]] SessionConfig to_session_config(const SessionTemplate &tmpl, EngineKind engine,
                                              const RuntimeSettings &runtime = {});

} // namespace liteagent::sandbox::templates

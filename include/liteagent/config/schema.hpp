#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace liteagent::config {

struct ContainerConfig {
  std::string engine = "podman";
  std::string template_name = "default";
  std::string image = "python:3.9-slim";
  std::string workdir = "/workspace";
  std::string interpreter = "python";
  std::string package_manager = "pip";
  std::string name_prefix = "liteagent";
  std::uint32_t host_grace_seconds = 10;
};

struct ObservabilityConfig {
  std::string backend = "log";
  std::string log_level = "info";
};

struct Config {
  ContainerConfig container;
  /// Raw [overrides] entries; keys are checked by validate_config.
  std::map<std::string, std::string> overrides;
  ObservabilityConfig observability;
};

} // namespace liteagent::config

#pragma once

#include "liteagent/common/result.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace liteagent::sandbox {

enum class EngineKind { Docker, Podman };
enum class FilesystemMode { ReadOnly, ReadWrite };

[[nodiscard]] std::string engine_kind_to_string(EngineKind kind);
[[nodiscard]] common::Result<EngineKind> parse_engine_kind(std::string_view value);
[[nodiscard]] std::string filesystem_mode_to_string(FilesystemMode mode);
[[nodiscard]] common::Result<FilesystemMode> parse_filesystem_mode(std::string_view value);

/// Container-side settings that templates never touch.
struct RuntimeSettings {
  std::string image = "python:3.9-slim";
  std::string workdir = "/workspace";
  std::string interpreter = "python";
  std::string package_manager = "pip";
  std::string name_prefix = "liteagent";
  std::uint32_t host_grace_seconds = 10;

  bool operator==(const RuntimeSettings &) const = default;
};

struct SessionConfig {
  EngineKind engine = EngineKind::Podman;
  std::string memory_limit = "1g";
  double cpu_limit = 1.0;
  std::uint32_t timeout_seconds = 30;
  bool network_enabled = false;
  FilesystemMode filesystem_mode = FilesystemMode::ReadOnly;
  std::vector<std::string> authorized_packages;
  RuntimeSettings runtime;

  bool operator==(const SessionConfig &) const = default;
};

/// Field-by-field replacements applied on top of a template.
struct SessionOverrides {
  std::optional<std::string> memory_limit;
  std::optional<double> cpu_limit;
  std::optional<std::uint32_t> timeout_seconds;
  std::optional<bool> network_enabled;
  std::optional<FilesystemMode> filesystem_mode;
  std::optional<std::vector<std::string>> authorized_packages;
  std::optional<std::string> image;

  [[nodiscard]] bool empty() const;
};

/// Limits shared by parse_override and validate_session_config. Engines read
/// "--cpus 0" and a zero memory limit as "unlimited", so both must stay positive.
inline constexpr std::uint32_t MAX_TIMEOUT_SECONDS = 86'400;
inline constexpr std::uint32_t MAX_HOST_GRACE_SECONDS = 3'600;
inline constexpr double MIN_CPU_LIMIT = 0.01;

/// Keys accepted by parse_override, in documentation order.
[[nodiscard]] const std::vector<std::string> &override_keys();

/// Parse one textual override ("timeout" = "15") into `overrides`.
/// Unknown keys and malformed values are rejected with InvalidArgument.
[[nodiscard]] common::Status parse_override(SessionOverrides &overrides, const std::string &key,
                                            const std::string &value);

/// Parse a "key=value" assignment, as given on the command line.
[[nodiscard]] common::Status parse_override_assignment(SessionOverrides &overrides,
                                                       const std::string &assignment);

/// Returns a new config with every present override applied. A supplied
/// package list replaces the template list instead of merging with it.
[[nodiscard]] SessionConfig apply_overrides(SessionConfig base, const SessionOverrides &overrides);

[[nodiscard]] common::Status validate_session_config(const SessionConfig &config);

/// Engine-native rendering of the cpu limit: "1", "0.5", "2.25".
[[nodiscard]] std::string format_cpu_limit(double cpus);

/// Comma-separated package list parsing; blanks dropped, order kept, duplicates removed.
[[nodiscard]] std::vector<std::string> parse_package_list(const std::string &value);

} // namespace liteagent::sandbox

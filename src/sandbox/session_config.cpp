#include "liteagent/sandbox/session_config.hpp"

#include "liteagent/common/fs.hpp"

#include <charconv>
#include <cmath>
#include <iomanip>
#include <regex>
#include <sstream>
#include <unordered_set>

namespace liteagent::sandbox {

namespace {

common::Status invalid(const std::string &message) {
  return common::Status::error(message, common::ErrorKind::InvalidArgument);
}

std::optional<bool> parse_bool(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "true" || normalized == "1" || normalized == "yes" || normalized == "on") {
    return true;
  }
  if (normalized == "false" || normalized == "0" || normalized == "no" || normalized == "off") {
    return false;
  }
  return std::nullopt;
}

bool is_valid_memory_limit(const std::string &value) {
  static const std::regex pattern(R"(^[0-9]+(\.[0-9]+)?[bkmgBKMG]?$)");
  if (!std::regex_match(value, pattern)) {
    return false;
  }
  // "0" and "0g" mean no limit to the engine.
  return value.find_first_of("123456789") != std::string::npos;
}

bool is_valid_cpu_limit(const double cpus) {
  return std::isfinite(cpus) && cpus >= MIN_CPU_LIMIT;
}

} // namespace

std::string engine_kind_to_string(const EngineKind kind) {
  switch (kind) {
  case EngineKind::Docker:
    return "docker";
  case EngineKind::Podman:
    return "podman";
  }
  return "podman";
}

common::Result<EngineKind> parse_engine_kind(std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "docker") {
    return common::Result<EngineKind>::success(EngineKind::Docker);
  }
  if (normalized == "podman") {
    return common::Result<EngineKind>::success(EngineKind::Podman);
  }
  return common::Result<EngineKind>::failure("Unsupported container engine: " + std::string(value),
                                             common::ErrorKind::InvalidArgument);
}

std::string filesystem_mode_to_string(const FilesystemMode mode) {
  switch (mode) {
  case FilesystemMode::ReadOnly:
    return "ro";
  case FilesystemMode::ReadWrite:
    return "rw";
  }
  return "ro";
}

common::Result<FilesystemMode> parse_filesystem_mode(std::string_view value) {
  const std::string normalized = common::to_lower(common::trim(std::string(value)));
  if (normalized == "ro" || normalized == "read-only" || normalized == "readonly") {
    return common::Result<FilesystemMode>::success(FilesystemMode::ReadOnly);
  }
  if (normalized == "rw" || normalized == "read-write" || normalized == "readwrite") {
    return common::Result<FilesystemMode>::success(FilesystemMode::ReadWrite);
  }
  return common::Result<FilesystemMode>::failure("Invalid filesystem mode: " + std::string(value),
                                                 common::ErrorKind::InvalidArgument);
}

bool SessionOverrides::empty() const {
  return !memory_limit.has_value() && !cpu_limit.has_value() && !timeout_seconds.has_value() &&
         !network_enabled.has_value() && !filesystem_mode.has_value() &&
         !authorized_packages.has_value() && !image.has_value();
}

const std::vector<std::string> &override_keys() {
  static const std::vector<std::string> keys = {
      "memory_limit", "cpu_limit", "timeout",  "network_enabled",
      "read_only",    "filesystem_mode",       "authorized_packages", "image",
  };
  return keys;
}

common::Status parse_override(SessionOverrides &overrides, const std::string &key,
                              const std::string &value) {
  const std::string name = common::to_lower(common::trim(key));
  const std::string text = common::trim(value);

  if (name == "memory_limit") {
    if (!is_valid_memory_limit(text)) {
      return invalid("memory_limit must be a non-zero size like 512m or 1g, got '" + value + "'");
    }
    overrides.memory_limit = text;
    return common::Status::success();
  }

  if (name == "cpu_limit") {
    std::size_t consumed = 0;
    double cpus = 0.0;
    try {
      cpus = std::stod(text, &consumed);
    } catch (const std::exception &) {
      consumed = 0;
    }
    if (consumed == 0 || consumed != text.size() || !is_valid_cpu_limit(cpus)) {
      return invalid("cpu_limit must be at least " + format_cpu_limit(MIN_CPU_LIMIT) +
                     " cores, got '" + value + "'");
    }
    overrides.cpu_limit = cpus;
    return common::Status::success();
  }

  if (name == "timeout" || name == "timeout_seconds") {
    std::uint32_t seconds = 0;
    const auto *first = text.data();
    const auto *last = first + text.size();
    const auto [ptr, ec] = std::from_chars(first, last, seconds);
    if (text.empty() || ec != std::errc() || ptr != last || seconds == 0 ||
        seconds > MAX_TIMEOUT_SECONDS) {
      return invalid("timeout must be an integer between 1 and " +
                     std::to_string(MAX_TIMEOUT_SECONDS) + " seconds, got '" + value + "'");
    }
    overrides.timeout_seconds = seconds;
    return common::Status::success();
  }

  if (name == "network_enabled") {
    const auto flag = parse_bool(text);
    if (!flag.has_value()) {
      return invalid("network_enabled must be true or false, got '" + value + "'");
    }
    overrides.network_enabled = *flag;
    return common::Status::success();
  }

  if (name == "read_only") {
    const auto flag = parse_bool(text);
    if (!flag.has_value()) {
      return invalid("read_only must be true or false, got '" + value + "'");
    }
    overrides.filesystem_mode = *flag ? FilesystemMode::ReadOnly : FilesystemMode::ReadWrite;
    return common::Status::success();
  }

  if (name == "filesystem_mode") {
    auto mode = parse_filesystem_mode(text);
    if (!mode.ok()) {
      return mode.status();
    }
    overrides.filesystem_mode = mode.value();
    return common::Status::success();
  }

  if (name == "authorized_packages" || name == "authorized_imports") {
    overrides.authorized_packages = parse_package_list(text);
    return common::Status::success();
  }

  if (name == "image") {
    if (text.empty()) {
      return invalid("image must not be empty");
    }
    overrides.image = text;
    return common::Status::success();
  }

  return invalid("Unknown override key: " + key);
}

common::Status parse_override_assignment(SessionOverrides &overrides,
                                         const std::string &assignment) {
  const auto eq = assignment.find('=');
  if (eq == std::string::npos || eq == 0) {
    return invalid("Override must be key=value, got '" + assignment + "'");
  }
  return parse_override(overrides, assignment.substr(0, eq), assignment.substr(eq + 1));
}

SessionConfig apply_overrides(SessionConfig base, const SessionOverrides &overrides) {
  if (overrides.memory_limit.has_value()) {
    base.memory_limit = *overrides.memory_limit;
  }
  if (overrides.cpu_limit.has_value()) {
    base.cpu_limit = *overrides.cpu_limit;
  }
  if (overrides.timeout_seconds.has_value()) {
    base.timeout_seconds = *overrides.timeout_seconds;
  }
  if (overrides.network_enabled.has_value()) {
    base.network_enabled = *overrides.network_enabled;
  }
  if (overrides.filesystem_mode.has_value()) {
    base.filesystem_mode = *overrides.filesystem_mode;
  }
  if (overrides.authorized_packages.has_value()) {
    base.authorized_packages.clear();
    std::unordered_set<std::string> seen;
    for (const auto &package : *overrides.authorized_packages) {
      const std::string name = common::trim(package);
      if (!name.empty() && seen.insert(name).second) {
        base.authorized_packages.push_back(name);
      }
    }
  }
  if (overrides.image.has_value()) {
    base.runtime.image = *overrides.image;
  }
  return base;
}

common::Status validate_session_config(const SessionConfig &config) {
  if (!is_valid_memory_limit(config.memory_limit)) {
    return invalid("memory_limit is invalid: '" + config.memory_limit + "'");
  }
  if (!is_valid_cpu_limit(config.cpu_limit)) {
    return invalid("cpu_limit must be at least " + format_cpu_limit(MIN_CPU_LIMIT) + " cores");
  }
  if (config.timeout_seconds == 0 || config.timeout_seconds > MAX_TIMEOUT_SECONDS) {
    return invalid("timeout must be between 1 and " + std::to_string(MAX_TIMEOUT_SECONDS) +
                   " seconds");
  }
  if (config.runtime.host_grace_seconds > MAX_HOST_GRACE_SECONDS) {
    return invalid("host_grace_seconds must not exceed " +
                   std::to_string(MAX_HOST_GRACE_SECONDS));
  }
  if (common::trim(config.runtime.image).empty()) {
    return invalid("image must not be empty");
  }
  if (config.runtime.workdir.empty() || config.runtime.workdir.front() != '/') {
    return invalid("workdir must be an absolute container path: '" + config.runtime.workdir + "'");
  }
  if (common::trim(config.runtime.interpreter).empty()) {
    return invalid("interpreter must not be empty");
  }
  if (common::trim(config.runtime.package_manager).empty()) {
    return invalid("package_manager must not be empty");
  }
  for (const auto &package : config.authorized_packages) {
    if (package.empty() || package.front() == '-') {
      return invalid("authorized package name is invalid: '" + package + "'");
    }
  }
  return common::Status::success();
}

std::string format_cpu_limit(const double cpus) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << cpus;
  std::string text = out.str();
  while (!text.empty() && text.back() == '0') {
    text.pop_back();
  }
  if (!text.empty() && text.back() == '.') {
    text.pop_back();
  }
  return text;
}

std::vector<std::string> parse_package_list(const std::string &value) {
  std::vector<std::string> packages;
  std::unordered_set<std::string> seen;
  std::stringstream stream(value);
  std::string part;
  while (std::getline(stream, part, ',')) {
    const std::string name = common::trim(part);
    if (!name.empty() && seen.insert(name).second) {
      packages.push_back(name);
    }
  }
  return packages;
}

} // namespace liteagent::sandbox

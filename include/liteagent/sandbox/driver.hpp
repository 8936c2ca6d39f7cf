#pragma once

#include "liteagent/sandbox/session_config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace liteagent::sandbox {

/// Translates session state into engine CLI argument vectors. Engines differ
/// only in the binary name and the bind-mount flag; everything else is shared.
class IContainerDriver {
public:
  virtual ~IContainerDriver() = default;

  [[nodiscard]] virtual EngineKind kind() const = 0;
  [[nodiscard]] virtual std::string binary() const = 0;

  /// Value for `-v`: "<shadow>:<workdir>:<options>".
  [[nodiscard]] virtual std::string build_mount_flag(const std::filesystem::path &shadow_dir,
                                                     const std::string &workdir,
                                                     FilesystemMode mode) const = 0;

  [[nodiscard]] std::vector<std::string>
  build_create_args(const SessionConfig &config, const std::string &container_name,
                    const std::filesystem::path &shadow_dir) const;
};

class DockerDriver final : public IContainerDriver {
public:
  [[nodiscard]] EngineKind kind() const override { return EngineKind::Docker; }
  [[nodiscard]] std::string binary() const override { return "docker"; }
  [[nodiscard]] std::string build_mount_flag(const std::filesystem::path &shadow_dir,
                                             const std::string &workdir,
                                             FilesystemMode mode) const override;
};

/// Read-write mounts carry the SELinux private relabel option.
class PodmanDriver final : public IContainerDriver {
public:
  [[nodiscard]] EngineKind kind() const override { return EngineKind::Podman; }
  [[nodiscard]] std::string binary() const override { return "podman"; }
  [[nodiscard]] std::string build_mount_flag(const std::filesystem::path &shadow_dir,
                                             const std::string &workdir,
                                             FilesystemMode mode) const override;
};

[[nodiscard]] std::unique_ptr<IContainerDriver> make_driver(EngineKind kind);

[[nodiscard]] std::vector<std::string> build_version_args();
[[nodiscard]] std::vector<std::string> build_install_args(const SessionConfig &config,
                                                          const std::string &container_id);
[[nodiscard]] std::vector<std::string> build_exec_args(const SessionConfig &config,
                                                       const std::string &container_id);
[[nodiscard]] std::vector<std::string> build_stop_args(const std::string &container_id);
[[nodiscard]] std::vector<std::string> build_remove_args(const std::string &container_id);

/// "<prefix>_<engine>_<8 hex chars>", unique across concurrently running sessions.
[[nodiscard]] std::string generate_container_name(const SessionConfig &config);

} // namespace liteagent::sandbox

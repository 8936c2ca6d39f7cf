#include "liteagent/sandbox/driver.hpp"

#include "liteagent/common/fs.hpp"
#include "liteagent/sandbox/result_protocol.hpp"

namespace liteagent::sandbox {

std::vector<std::string> IContainerDriver::build_create_args(const SessionConfig &config,
                                                             const std::string &container_name,
                                                             const std::filesystem::path &shadow_dir) const {
  std::vector<std::string> args = {"run", "-d", "--name", container_name};
  args.push_back("--memory");
  args.push_back(config.memory_limit);
  args.push_back("--cpus");
  args.push_back(format_cpu_limit(config.cpu_limit));
  args.push_back(config.network_enabled ? "--network=bridge" : "--network=none");
  args.push_back("-v");
  args.push_back(build_mount_flag(shadow_dir, config.runtime.workdir, config.filesystem_mode));
  args.push_back("-w");
  args.push_back(config.runtime.workdir);
  args.push_back(config.runtime.image);
  // The image's default command may exit at once; the container must outlive every exec.
  args.push_back("sleep");
  args.push_back("infinity");
  return args;
}

std::string DockerDriver::build_mount_flag(const std::filesystem::path &shadow_dir,
                                           const std::string &workdir,
                                           const FilesystemMode mode) const {
  return shadow_dir.string() + ":" + workdir + ":" +
         (mode == FilesystemMode::ReadOnly ? "ro" : "rw");
}

std::string PodmanDriver::build_mount_flag(const std::filesystem::path &shadow_dir,
                                           const std::string &workdir,
                                           const FilesystemMode mode) const {
  return shadow_dir.string() + ":" + workdir + ":" +
         (mode == FilesystemMode::ReadOnly ? "ro" : "rw,Z");
}

std::unique_ptr<IContainerDriver> make_driver(const EngineKind kind) {
  switch (kind) {
  case EngineKind::Docker:
    return std::make_unique<DockerDriver>();
  case EngineKind::Podman:
    return std::make_unique<PodmanDriver>();
  }
  return std::make_unique<PodmanDriver>();
}

std::vector<std::string> build_version_args() { return {"--version"}; }

std::vector<std::string> build_install_args(const SessionConfig &config,
                                            const std::string &container_id) {
  std::vector<std::string> args = {"exec", container_id, config.runtime.package_manager, "install",
                                   "--no-cache-dir"};
  args.insert(args.end(), config.authorized_packages.begin(), config.authorized_packages.end());
  return args;
}

std::vector<std::string> build_exec_args(const SessionConfig &config,
                                         const std::string &container_id) {
  return {"exec",
          "-w",
          config.runtime.workdir,
          container_id,
          "timeout",
          std::to_string(config.timeout_seconds),
          config.runtime.interpreter,
          std::string(protocol::WRAPPER_FILENAME)};
}

std::vector<std::string> build_stop_args(const std::string &container_id) {
  return {"stop", container_id};
}

std::vector<std::string> build_remove_args(const std::string &container_id) {
  return {"rm", container_id};
}

std::string generate_container_name(const SessionConfig &config) {
  std::string prefix = common::trim(config.runtime.name_prefix);
  if (prefix.empty()) {
    prefix = "liteagent";
  }
  return prefix + "_" + engine_kind_to_string(config.engine) + "_" + common::random_hex(4);
}

} // namespace liteagent::sandbox

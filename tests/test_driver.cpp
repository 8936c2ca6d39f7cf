#include "test_framework.hpp"

#include "liteagent/sandbox/driver.hpp"

#include <regex>
#include <set>

namespace {

using Args = std::vector<std::string>;

liteagent::sandbox::SessionConfig sample_config(const liteagent::sandbox::EngineKind engine) {
  liteagent::sandbox::SessionConfig config;
  config.engine = engine;
  config.memory_limit = "512m";
  config.cpu_limit = 0.5;
  config.timeout_seconds = 15;
  config.authorized_packages = {"numpy", "pandas"};
  return config;
}

} // namespace

void register_driver_tests(std::vector<liteagent::tests::TestCase> &tests) {
  using liteagent::tests::require;
  namespace sbx = liteagent::sandbox;

  tests.push_back({"docker_create_args", [] {
                     const auto config = sample_config(sbx::EngineKind::Docker);
                     const auto driver = sbx::make_driver(sbx::EngineKind::Docker);
                     require(driver->binary() == "docker", "docker binary");
                     const Args expected = {"run",      "-d",
                                            "--name",   "la_docker_0a1b2c3d",
                                            "--memory", "512m",
                                            "--cpus",   "0.5",
                                            "--network=none",
                                            "-v",       "/tmp/shadow:/workspace:ro",
                                            "-w",       "/workspace",
                                            "python:3.9-slim",
                                            "sleep",    "infinity"};
                     require(driver->build_create_args(config, "la_docker_0a1b2c3d", "/tmp/shadow") ==
                                 expected,
                             "docker create args mismatch");
                   }});

  tests.push_back({"podman_create_args_with_network_and_rw", [] {
                     auto config = sample_config(sbx::EngineKind::Podman);
                     config.network_enabled = true;
                     config.filesystem_mode = sbx::FilesystemMode::ReadWrite;
                     config.cpu_limit = 2.0;
                     const auto driver = sbx::make_driver(sbx::EngineKind::Podman);
                     require(driver->binary() == "podman", "podman binary");
                     const auto args = driver->build_create_args(config, "n", "/tmp/s");
                     require(args[5] == "512m" && args[7] == "2", "limits formatted");
                     require(args[8] == "--network=bridge", "network enabled uses bridge");
                     require(args[10] == "/tmp/s:/workspace:rw,Z", "podman rw mount relabels");
                   }});

  tests.push_back({"mount_flags_per_engine", [] {
                     const sbx::DockerDriver docker;
                     const sbx::PodmanDriver podman;
                     require(docker.build_mount_flag("/s", "/w", sbx::FilesystemMode::ReadWrite) ==
                                 "/s:/w:rw",
                             "docker rw");
                     require(podman.build_mount_flag("/s", "/w", sbx::FilesystemMode::ReadOnly) ==
                                 "/s:/w:ro",
                             "podman ro has no relabel");
                     require(docker.kind() == sbx::EngineKind::Docker &&
                                 podman.kind() == sbx::EngineKind::Podman,
                             "kinds");
                   }});

  tests.push_back({"lifecycle_args", [] {
                     const auto config = sample_config(sbx::EngineKind::Podman);
                     require(sbx::build_version_args() == Args{"--version"}, "version args");
                     require(sbx::build_install_args(config, "abc") ==
                                 (Args{"exec", "abc", "pip", "install", "--no-cache-dir", "numpy",
                                       "pandas"}),
                             "install args");
                     require(sbx::build_exec_args(config, "abc") ==
                                 (Args{"exec", "-w", "/workspace", "abc", "timeout", "15", "python",
                                       "_liteagent_wrapper.py"}),
                             "exec args");
                     require(sbx::build_stop_args("abc") == (Args{"stop", "abc"}), "stop args");
                     require(sbx::build_remove_args("abc") == (Args{"rm", "abc"}), "rm args");
                   }});

  tests.push_back({"container_names_are_prefixed_and_unique", [] {
                     auto config = sample_config(sbx::EngineKind::Docker);
                     config.runtime.name_prefix = "agent";
                     const std::regex pattern("^agent_docker_[0-9a-f]{8}$");
                     std::set<std::string> names;
                     for (int i = 0; i < 64; ++i) {
                       const auto name = sbx::generate_container_name(config);
                       require(std::regex_match(name, pattern), "bad name: " + name);
                       names.insert(name);
                     }
                     require(names.size() == 64, "names should not repeat");

                     config.runtime.name_prefix = "  ";
                     config.engine = sbx::EngineKind::Podman;
                     require(sbx::generate_container_name(config).rfind("liteagent_podman_", 0) == 0,
                             "blank prefix falls back");
                   }});
}

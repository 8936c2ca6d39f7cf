#pragma once

#include "liteagent/common/result.hpp"
#include "liteagent/sandbox/driver.hpp"
#include "liteagent/sandbox/engine.hpp"
#include "liteagent/sandbox/result_protocol.hpp"
#include "liteagent/sandbox/session_config.hpp"
#include "liteagent/sandbox/shadow_copy.hpp"

#include <filesystem>
#include <memory>
#include <string>

namespace liteagent::sandbox {

enum class SessionState {
  Uninitialized,
  ShadowCopied,
  ContainerCreated,
  PackagesInstalled,
  Ready,
  Executing,
  Cleaned,
};

[[nodiscard]] std::string session_state_to_string(SessionState state);

/// One container bound to one shadow directory, used from prepare() through
/// cleanup() and never again. Sessions share no state with each other.
class ContainerSession {
public:
  /// Fails with EngineUnavailable when `<engine> --version` cannot run or exits
  /// non-zero, and with InvalidArgument for a missing source directory or an
  /// invalid configuration.
  [[nodiscard]] static common::Result<std::unique_ptr<ContainerSession>>
  create(const std::filesystem::path &source_dir, SessionConfig config,
         std::unique_ptr<IContainerDriver> driver,
         std::shared_ptr<IEngineRunner> runner = std::make_shared<EngineCliRunner>(),
         ShadowCopyManager shadow = ShadowCopyManager{});

  ~ContainerSession();

  ContainerSession(const ContainerSession &) = delete;
  ContainerSession &operator=(const ContainerSession &) = delete;

  /// Shadow copy, container creation and package install. A failed container
  /// creation removes the shadow directory before returning. Throws
  /// std::logic_error when called on a session that is not Uninitialized.
  [[nodiscard]] common::Status prepare();

  /// Runs `code` through the result wrapper. Sandboxed failures come back as
  /// success=false; throws std::logic_error unless the session is Ready.
  [[nodiscard]] ExecutionResult execute(const std::string &code);

  /// Stops and removes the container, then deletes the shadow directory.
  /// Every step is attempted; failures are logged. Safe to call repeatedly.
  void cleanup() noexcept;

  [[nodiscard]] SessionState state() const { return state_; }
  [[nodiscard]] const SessionConfig &config() const { return config_; }
  [[nodiscard]] const std::filesystem::path &source_dir() const { return source_dir_; }
  [[nodiscard]] const std::filesystem::path &shadow_dir() const { return shadow_dir_; }
  [[nodiscard]] const std::string &container_id() const { return container_id_; }
  [[nodiscard]] const std::string &container_name() const { return container_name_; }
  [[nodiscard]] const std::string &engine_version() const { return engine_version_; }
  [[nodiscard]] const IContainerDriver &driver() const { return *driver_; }

private:
  /// Restricts construction to create().
  struct ConstructionKey {
    explicit ConstructionKey() = default;
  };

public:
  ContainerSession(ConstructionKey, std::filesystem::path source_dir, SessionConfig config,
                   std::unique_ptr<IContainerDriver> driver, std::shared_ptr<IEngineRunner> runner,
                   ShadowCopyManager shadow, std::string engine_version);

private:

  void install_packages();
  bool discard_container(const std::string &reference);
  [[nodiscard]] ExecutionResult run_wrapper(const std::string &code);
  [[nodiscard]] std::string engine_name() const;

  std::filesystem::path source_dir_;
  SessionConfig config_;
  std::unique_ptr<IContainerDriver> driver_;
  std::shared_ptr<IEngineRunner> runner_;
  ShadowCopyManager shadow_;
  std::string engine_version_;

  SessionState state_ = SessionState::Uninitialized;
  std::filesystem::path shadow_dir_;
  std::string container_name_;
  std::string container_id_;
};

} // namespace liteagent::sandbox

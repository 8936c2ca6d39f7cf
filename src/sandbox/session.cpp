#include "liteagent/sandbox/session.hpp"

#include "liteagent/common/fs.hpp"
#include "liteagent/observability/global.hpp"

#include <chrono>
#include <cstdint>
#include <stdexcept>

namespace liteagent::sandbox {

namespace {

constexpr const char *COMPONENT = "session";

constexpr std::chrono::milliseconds VERSION_CHECK_TIMEOUT{15'000};
constexpr std::chrono::milliseconds CREATE_TIMEOUT{120'000};
constexpr std::chrono::milliseconds INSTALL_TIMEOUT{600'000};
constexpr std::chrono::milliseconds TEARDOWN_TIMEOUT{60'000};

/// GNU coreutils `timeout` exits with 124 when the limit fired.
constexpr int TIMEOUT_EXIT_CODE = 124;

std::string last_line(const std::string &text) {
  const std::string trimmed = common::trim(text);
  const auto newline = trimmed.find_last_of('\n');
  return newline == std::string::npos ? trimmed : common::trim(trimmed.substr(newline + 1));
}

std::string failure_detail(const common::Result<EngineProcessResult> &run) {
  if (!run.ok()) {
    return run.error();
  }
  const std::string stderr_text = common::trim(run.value().stderr_text);
  if (!stderr_text.empty()) {
    return stderr_text;
  }
  return "exit code " + std::to_string(run.value().exit_code);
}

bool succeeded(const common::Result<EngineProcessResult> &run) {
  return run.ok() && run.value().exit_code == 0 && !run.value().timed_out;
}

ExecutionResult infrastructure_failure(const std::string &message) {
  ExecutionResult result;
  result.success = false;
  result.error = message;
  result.logs = "Error executing code: " + message;
  return result;
}

} // namespace

std::string session_state_to_string(const SessionState state) {
  switch (state) {
  case SessionState::Uninitialized:
    return "uninitialized";
  case SessionState::ShadowCopied:
    return "shadow_copied";
  case SessionState::ContainerCreated:
    return "container_created";
  case SessionState::PackagesInstalled:
    return "packages_installed";
  case SessionState::Ready:
    return "ready";
  case SessionState::Executing:
    return "executing";
  case SessionState::Cleaned:
    return "cleaned";
  }
  return "uninitialized";
}

common::Result<std::unique_ptr<ContainerSession>>
ContainerSession::create(const std::filesystem::path &source_dir, SessionConfig config,
                         std::unique_ptr<IContainerDriver> driver,
                         std::shared_ptr<IEngineRunner> runner, ShadowCopyManager shadow) {
  using ResultT = common::Result<std::unique_ptr<ContainerSession>>;
  if (!driver) {
    return ResultT::failure("container driver is required", common::ErrorKind::InvalidArgument);
  }
  if (!runner) {
    return ResultT::failure("engine runner is required", common::ErrorKind::InvalidArgument);
  }
  if (driver->kind() != config.engine) {
    return ResultT::failure("driver " + driver->binary() + " does not match engine " +
                                engine_kind_to_string(config.engine),
                            common::ErrorKind::InvalidArgument);
  }
  if (auto valid = validate_session_config(config); !valid.ok()) {
    return ResultT::failure(valid);
  }

  std::error_code ec;
  if (source_dir.empty() || !std::filesystem::is_directory(source_dir, ec)) {
    return ResultT::failure("Source directory does not exist: " + source_dir.string(),
                            common::ErrorKind::InvalidArgument);
  }
  auto absolute_source = std::filesystem::absolute(source_dir, ec);
  if (ec) {
    absolute_source = source_dir;
  }

  const std::string binary = driver->binary();
  auto version_check =
      runner->run(binary, build_version_args(),
                  EngineCommandOptions{.allow_failure = true, .timeout = VERSION_CHECK_TIMEOUT});
  if (!version_check.ok()) {
    return ResultT::failure(binary + " is not installed or not available in PATH: " +
                                version_check.error(),
                            common::ErrorKind::EngineUnavailable);
  }
  if (version_check.value().exit_code != 0 || version_check.value().timed_out) {
    return ResultT::failure(binary + " --version failed: " + failure_detail(version_check),
                            common::ErrorKind::EngineUnavailable);
  }
  std::string version = common::trim(version_check.value().stdout_text);
  observability::record_debug(COMPONENT, binary + " version: " + version);

  return ResultT::success(std::make_unique<ContainerSession>(
      ConstructionKey{}, std::move(absolute_source), std::move(config), std::move(driver),
      std::move(runner), std::move(shadow), std::move(version)));
}

ContainerSession::ContainerSession(ConstructionKey, std::filesystem::path source_dir,
                                   SessionConfig config, std::unique_ptr<IContainerDriver> driver,
                                   std::shared_ptr<IEngineRunner> runner, ShadowCopyManager shadow,
                                   std::string engine_version)
    : source_dir_(std::move(source_dir)), config_(std::move(config)), driver_(std::move(driver)),
      runner_(std::move(runner)), shadow_(std::move(shadow)),
      engine_version_(std::move(engine_version)) {}

ContainerSession::~ContainerSession() { cleanup(); }

std::string ContainerSession::engine_name() const { return engine_kind_to_string(config_.engine); }

common::Status ContainerSession::prepare() {
  if (state_ != SessionState::Uninitialized) {
    throw std::logic_error("prepare() requires an uninitialized session; state is " +
                           session_state_to_string(state_));
  }

  auto shadow = shadow_.create(source_dir_);
  if (!shadow.ok()) {
    state_ = SessionState::Cleaned;
    return shadow.status();
  }
  shadow_dir_ = shadow.value();
  state_ = SessionState::ShadowCopied;

  container_name_ = generate_container_name(config_);
  const auto args = driver_->build_create_args(config_, container_name_, shadow_dir_);
  auto created = runner_->run(driver_->binary(), args,
                              EngineCommandOptions{.allow_failure = true, .timeout = CREATE_TIMEOUT});
  if (!succeeded(created)) {
    const std::string message =
        "Failed to create " + engine_name() + " container: " + failure_detail(created);
    observability::record_error(COMPONENT, message);
    if (created.ok() && created.value().timed_out) {
      (void)discard_container(container_name_);
    }
    shadow_.cleanup(shadow_dir_);
    shadow_dir_.clear();
    container_name_.clear();
    state_ = SessionState::Cleaned;
    const auto kind = created.ok() || created.kind() != common::ErrorKind::EngineUnavailable
                          ? common::ErrorKind::ContainerCreate
                          : common::ErrorKind::EngineUnavailable;
    return common::Status::error(message, kind);
  }

  container_id_ = last_line(created.value().stdout_text);
  if (container_id_.empty()) {
    container_id_ = container_name_;
  }
  state_ = SessionState::ContainerCreated;
  observability::session_opened();
  observability::record_debug(COMPONENT, "Created " + engine_name() + " container: " +
                                             container_id_ + " (name: " + container_name_ + ")");

  if (!config_.authorized_packages.empty()) {
    install_packages();
    state_ = SessionState::PackagesInstalled;
  }

  state_ = SessionState::Ready;
  observability::record_session_prepared(engine_name(), container_name_, container_id_,
                                         shadow_dir_.string());
  return common::Status::success();
}

void ContainerSession::install_packages() {
  auto installed = runner_->run(driver_->binary(), build_install_args(config_, container_id_),
                                EngineCommandOptions{.allow_failure = true, .timeout = INSTALL_TIMEOUT});
  const bool ok = succeeded(installed);
  if (!ok) {
    observability::record_warning(COMPONENT,
                                  "Failed to install some packages: " + failure_detail(installed));
  }
  observability::record_package_install(engine_name(), config_.authorized_packages, ok);
}

ExecutionResult ContainerSession::execute(const std::string &code) {
  if (state_ != SessionState::Ready) {
    throw std::logic_error("execute() requires a prepared session; state is " +
                           session_state_to_string(state_));
  }
  if (container_id_.empty()) {
    throw std::logic_error("execute() called without a container");
  }

  state_ = SessionState::Executing;
  const auto started = std::chrono::steady_clock::now();
  ExecutionResult result = run_wrapper(code);
  const auto duration =
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
  state_ = SessionState::Ready;

  observability::record_execution(engine_name(), duration, result.success, result.timed_out);
  return result;
}

ExecutionResult ContainerSession::run_wrapper(const std::string &code) {
  if (auto written = common::write_text_file(shadow_dir_ / protocol::CODE_FILENAME, code);
      !written.ok()) {
    return infrastructure_failure(written.error());
  }
  if (auto written = common::write_text_file(shadow_dir_ / protocol::WRAPPER_FILENAME,
                                             std::string(protocol::WRAPPER_SCRIPT));
      !written.ok()) {
    return infrastructure_failure(written.error());
  }

  const std::chrono::milliseconds backstop =
      std::chrono::seconds(std::uint64_t{config_.timeout_seconds} +
                           config_.runtime.host_grace_seconds);
  auto run = runner_->run(driver_->binary(), build_exec_args(config_, container_id_),
                          EngineCommandOptions{.allow_failure = true, .timeout = backstop});
  if (!run.ok()) {
    return infrastructure_failure(run.error());
  }

  const auto &process = run.value();
  ExecutionResult result = parse_execution_output(process.stdout_text, process.stderr_text);
  result.exit_code = process.exit_code;
  result.timed_out = process.timed_out || (!result.sentinel_found && process.exit_code == TIMEOUT_EXIT_CODE);
  if (result.timed_out) {
    result.success = false;
    result.error = "Execution timed out after " + std::to_string(config_.timeout_seconds) + " seconds";
  }
  return result;
}

bool ContainerSession::discard_container(const std::string &reference) {
  const EngineCommandOptions options{.allow_failure = true, .timeout = TEARDOWN_TIMEOUT};
  auto stopped = runner_->run(driver_->binary(), build_stop_args(reference), options);
  if (!succeeded(stopped)) {
    observability::record_warning(COMPONENT, "Failed to stop " + engine_name() + " container " +
                                                 reference + ": " + failure_detail(stopped));
  }
  auto removed = runner_->run(driver_->binary(), build_remove_args(reference), options);
  if (!succeeded(removed)) {
    observability::record_warning(COMPONENT, "Failed to remove " + engine_name() + " container " +
                                                 reference + ": " + failure_detail(removed));
    return false;
  }
  observability::record_debug(COMPONENT, "Removed " + engine_name() + " container: " + reference);
  return true;
}

void ContainerSession::cleanup() noexcept {
  if (state_ == SessionState::Cleaned) {
    return;
  }

  const bool had_container = !container_id_.empty();
  if (!had_container && shadow_dir_.empty()) {
    // Never prepared: nothing was allocated, so there is nothing to report.
    state_ = SessionState::Cleaned;
    return;
  }
  bool container_removed = true;
  if (had_container) {
    try {
      container_removed = discard_container(container_id_);
    } catch (const std::exception &e) {
      container_removed = false;
      observability::record_error(COMPONENT, std::string("Error removing container: ") + e.what());
    }
  }

  const bool shadow_removed = shadow_.cleanup(shadow_dir_);
  try {
    if (had_container) {
      observability::session_closed();
    }
    observability::record_session_cleaned(engine_name(), container_removed, shadow_removed);
  } catch (const std::exception &e) {
    observability::record_error(COMPONENT, std::string("Error reporting cleanup: ") + e.what());
  }

  container_id_.clear();
  container_name_.clear();
  shadow_dir_.clear();
  state_ = SessionState::Cleaned;
}

} // namespace liteagent::sandbox

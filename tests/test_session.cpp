#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "liteagent/common/fs.hpp"
#include "liteagent/observability/global.hpp"
#include "liteagent/sandbox/factory.hpp"
#include "liteagent/sandbox/session.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <tuple>
#include <utility>

namespace {

namespace sbx = liteagent::sandbox;
using liteagent::testing::FakeEngineRunner;
using liteagent::testing::TempWorkspace;

struct SessionFixture {
  TempWorkspace source;
  TempWorkspace temp_root;
  std::shared_ptr<FakeEngineRunner> runner = std::make_shared<FakeEngineRunner>();

  SessionFixture() { source.create_file("data/input.txt", "payload"); }

  [[nodiscard]] liteagent::common::Result<std::unique_ptr<sbx::ContainerSession>>
  make(sbx::SessionConfig config = {}) const {
    const auto engine = config.engine;
    return sbx::ContainerSession::create(source.path(), std::move(config), sbx::make_driver(engine),
                                         runner, sbx::ShadowCopyManager(temp_root.path()));
  }
};

template <typename Fn> bool throws_logic_error(Fn &&fn) {
  try {
    fn();
  } catch (const std::logic_error &) {
    return true;
  }
  return false;
}

} // namespace

void register_session_tests(std::vector<liteagent::tests::TestCase> &tests) {
  using liteagent::tests::require;
  namespace obs = liteagent::observability;

  tests.push_back({"session_full_lifecycle", [] {
                     SessionFixture fixture;
                     sbx::SessionConfig config;
                     config.authorized_packages = {"numpy"};
                     auto created = fixture.make(config);
                     require(created.ok(), created.error());
                     auto &session = *created.value();
                     require(session.state() == sbx::SessionState::Uninitialized, "starts uninitialized");
                     require(session.engine_version().find("podman") != std::string::npos,
                             "engine version recorded");

                     require(session.prepare().ok(), "prepare should succeed");
                     require(session.state() == sbx::SessionState::Ready, "ready after prepare");
                     require(session.container_id() == "fakecontainer1", "id from run output");
                     require(session.container_name().rfind("liteagent_podman_", 0) == 0,
                             "generated name");
                     require(std::filesystem::exists(session.shadow_dir() / "data/input.txt"),
                             "shadow copy populated");

                     fixture.runner->set_execution_output(liteagent::testing::sentinel_output(
                         R"({"success": true, "result": 42, "output": "hi\n"})"));
                     const auto result = session.execute("_liteagent_result = 42");
                     require(result.success, "execution should succeed");
                     require(result.result_json == std::optional<std::string>("42"), "result 42");
                     require(result.logs == "hi\n", "logs");
                     require(session.state() == sbx::SessionState::Ready, "ready after execute");

                     const auto shadow = session.shadow_dir();
                     session.cleanup();
                     require(session.state() == sbx::SessionState::Cleaned, "cleaned");
                     require(!std::filesystem::exists(shadow), "shadow removed");
                     require(fixture.runner->live_containers.empty(), "container removed");

                     std::vector<std::string> order;
                     for (const auto &call : fixture.runner->calls) {
                       order.push_back(call.args.front() == "exec" && call.args[3] == "install"
                                           ? "install"
                                           : call.args.front());
                     }
                     require((order == std::vector<std::string>{"--version", "run", "install", "exec",
                                                                "stop", "rm"}),
                             "engine call order");
                     for (const auto &call : fixture.runner->calls) {
                       require(call.binary == "podman", "every call targets podman");
                     }
                   }});

  tests.push_back({"execute_writes_code_and_wrapper", [] {
                     SessionFixture fixture;
                     auto created = fixture.make();
                     require(created.ok(), created.error());
                     auto &session = *created.value();
                     require(session.prepare().ok(), "prepare");
                     (void)session.execute("print('x')");
                     const auto code = liteagent::common::read_text_file(
                         session.shadow_dir() / std::string(sbx::protocol::CODE_FILENAME));
                     require(code.ok() && code.value() == "print('x')", "code file written");
                     const auto wrapper = liteagent::common::read_text_file(
                         session.shadow_dir() / std::string(sbx::protocol::WRAPPER_FILENAME));
                     require(wrapper.ok() && wrapper.value() == sbx::protocol::WRAPPER_SCRIPT,
                             "wrapper written");
                     require(liteagent::common::read_text_file(fixture.source.path() /
                                                               std::string(sbx::protocol::CODE_FILENAME))
                                 .kind() == liteagent::common::ErrorKind::Io,
                             "source directory untouched");
                     const auto *exec = fixture.runner->find("exec");
                     require(exec != nullptr, "exec call recorded");
                     require(exec->options.timeout == std::chrono::seconds(30 + 10),
                             "host backstop is timeout plus grace");
                   }});

  tests.push_back({"maximum_timeout_backstop_does_not_wrap", [] {
                     SessionFixture fixture;
                     sbx::SessionConfig config;
                     config.timeout_seconds = sbx::MAX_TIMEOUT_SECONDS;
                     config.runtime.host_grace_seconds = sbx::MAX_HOST_GRACE_SECONDS;
                     auto created = fixture.make(config);
                     require(created.ok(), created.error());
                     auto &session = *created.value();
                     require(session.prepare().ok(), "prepare");
                     (void)session.execute("print('x')");
                     const auto *exec = fixture.runner->find("exec");
                     require(exec != nullptr, "exec call recorded");
                     require(exec->options.timeout == std::chrono::seconds(86'400 + 3'600),
                             "backstop keeps the full sum");
                     const auto timeout_arg = std::find(exec->args.begin(), exec->args.end(), "timeout");
                     require(timeout_arg != exec->args.end() && std::next(timeout_arg) != exec->args.end(),
                             "in-container timeout present");
                     require(*std::next(timeout_arg) == "86400", "in-container timeout value");
                   }});

  tests.push_back({"create_failure_rolls_back_shadow", [] {
                     SessionFixture fixture;
                     sbx::EngineProcessResult failed;
                     failed.exit_code = 125;
                     failed.stderr_text = "Error: image not known\n";
                     fixture.runner->set_response("run", failed);
                     auto created = fixture.make();
                     require(created.ok(), created.error());
                     auto &session = *created.value();
                     const auto status = session.prepare();
                     require(!status.ok(), "prepare should fail");
                     require(status.kind() == liteagent::common::ErrorKind::ContainerCreate,
                             "ContainerCreate expected");
                     require(status.error().find("image not known") != std::string::npos,
                             "engine stderr included");
                     require(session.state() == sbx::SessionState::Cleaned, "session is spent");
                     require(session.shadow_dir().empty(), "shadow dir cleared");
                     require(std::filesystem::is_empty(fixture.temp_root.path()),
                             "no shadow directory left behind");
                     require(fixture.runner->count("exec") == 0, "nothing executed");
                   }});

  tests.push_back({"create_timeout_discards_by_name", [] {
                     SessionFixture fixture;
                     sbx::EngineProcessResult hung;
                     hung.timed_out = true;
                     hung.exit_code = -1;
                     fixture.runner->set_response("run", hung);
                     auto created = fixture.make();
                     require(created.ok(), created.error());
                     const auto status = created.value()->prepare();
                     require(!status.ok(), "prepare should fail");
                     const auto *rm = fixture.runner->find("rm");
                     require(rm != nullptr, "container removal attempted");
                     require(rm->args.back().rfind("liteagent_podman_", 0) == 0,
                             "removal by generated name");
                   }});

  tests.push_back({"cleanup_is_idempotent", [] {
                     SessionFixture fixture;
                     auto created = fixture.make();
                     require(created.ok(), created.error());
                     auto &session = *created.value();
                     require(session.prepare().ok(), "prepare");
                     session.cleanup();
                     session.cleanup();
                     require(fixture.runner->count("rm") == 1, "container removed once");
                     require(session.container_id().empty(), "id cleared");
                     require(session.shadow_dir().empty(), "shadow cleared");
                   }});

  tests.push_back({"cleanup_without_prepare_reports_nothing", [] {
                     liteagent::testing::ScopedRecordingObserver scoped;
                     SessionFixture fixture;
                     auto created = fixture.make();
                     require(created.ok(), created.error());
                     auto &session = *created.value();
                     session.cleanup();
                     require(session.state() == sbx::SessionState::Cleaned, "cleaned");
                     require(scoped.observer().events_of<obs::SessionCleanedEvent>().empty(),
                             "no cleanup event for a session that owned nothing");
                     require(fixture.runner->count("stop") == 0 && fixture.runner->count("rm") == 0,
                             "engine not asked to remove anything");
                     require(throws_logic_error([&] { (void)session.prepare(); }),
                             "cleaned session stays single-use");
                   }});

  tests.push_back({"cleanup_continues_after_engine_errors", [] {
                     SessionFixture fixture;
                     auto created = fixture.make();
                     require(created.ok(), created.error());
                     auto &session = *created.value();
                     require(session.prepare().ok(), "prepare");
                     const auto shadow = session.shadow_dir();
                     sbx::EngineProcessResult failed;
                     failed.exit_code = 1;
                     failed.stderr_text = "no such container";
                     fixture.runner->set_response("stop", failed);
                     fixture.runner->set_response("rm", failed);
                     session.cleanup();
                     require(!std::filesystem::exists(shadow), "shadow still removed");
                     require(session.state() == sbx::SessionState::Cleaned, "cleaned");
                   }});

  tests.push_back({"destructor_cleans_up", [] {
                     SessionFixture fixture;
                     std::filesystem::path shadow;
                     {
                       auto created = fixture.make();
                       require(created.ok(), created.error());
                       require(created.value()->prepare().ok(), "prepare");
                       shadow = created.value()->shadow_dir();
                     }
                     require(!std::filesystem::exists(shadow), "shadow removed by destructor");
                     require(fixture.runner->live_containers.empty(), "container removed by destructor");
                   }});

  tests.push_back({"state_violations_throw", [] {
                     SessionFixture fixture;
                     auto created = fixture.make();
                     require(created.ok(), created.error());
                     auto &session = *created.value();
                     require(throws_logic_error([&] { (void)session.execute("1"); }),
                             "execute before prepare");
                     require(session.prepare().ok(), "prepare");
                     require(throws_logic_error([&] { (void)session.prepare(); }), "prepare twice");
                     session.cleanup();
                     require(throws_logic_error([&] { (void)session.execute("1"); }),
                             "execute after cleanup");
                     require(throws_logic_error([&] { (void)session.prepare(); }),
                             "prepare after cleanup");
                   }});

  tests.push_back({"package_install_failure_is_not_fatal", [] {
                     liteagent::testing::ScopedRecordingObserver scoped;
                     SessionFixture fixture;
                     sbx::EngineProcessResult failed;
                     failed.exit_code = 1;
                     failed.stderr_text = "ERROR: No matching distribution found for nosuchpkg";
                     fixture.runner->set_response("install", failed);
                     sbx::SessionConfig config;
                     config.authorized_packages = {"nosuchpkg"};
                     auto created = fixture.make(config);
                     require(created.ok(), created.error());
                     require(created.value()->prepare().ok(), "prepare should still succeed");
                     require(created.value()->state() == sbx::SessionState::Ready, "ready");
                     const auto installs = scoped.observer().events_of<obs::PackageInstallEvent>();
                     require(installs.size() == 1 && !installs[0].success,
                             "failed install recorded");
                   }});

  tests.push_back({"no_packages_skips_install", [] {
                     SessionFixture fixture;
                     sbx::SessionConfig config;
                     config.authorized_packages.clear();
                     auto created = fixture.make(config);
                     require(created.ok(), created.error());
                     require(created.value()->prepare().ok(), "prepare");
                     require(fixture.runner->count("install") == 0, "no install call");
                   }});

  tests.push_back({"engine_unavailable", [] {
                     SessionFixture fixture;
                     fixture.runner->set_unavailable(true);
                     auto created = fixture.make();
                     require(!created.ok(), "missing engine must fail");
                     require(created.kind() == liteagent::common::ErrorKind::EngineUnavailable,
                             "EngineUnavailable expected");

                     SessionFixture broken;
                     sbx::EngineProcessResult failed;
                     failed.exit_code = 1;
                     broken.runner->set_response("--version", failed);
                     auto broken_engine = broken.make();
                     require(!broken_engine.ok() &&
                                 broken_engine.kind() == liteagent::common::ErrorKind::EngineUnavailable,
                             "non-zero --version is EngineUnavailable");
                   }});

  tests.push_back({"create_rejects_bad_arguments", [] {
                     SessionFixture fixture;
                     auto missing = sbx::ContainerSession::create(
                         fixture.source.path() / "nope", sbx::SessionConfig{},
                         sbx::make_driver(sbx::EngineKind::Podman), fixture.runner);
                     require(!missing.ok() &&
                                 missing.kind() == liteagent::common::ErrorKind::InvalidArgument,
                             "missing source dir");

                     auto mismatch = sbx::ContainerSession::create(
                         fixture.source.path(), sbx::SessionConfig{},
                         sbx::make_driver(sbx::EngineKind::Docker), fixture.runner);
                     require(!mismatch.ok(), "driver must match engine");

                     sbx::SessionConfig invalid;
                     invalid.timeout_seconds = 0;
                     require(!fixture.make(invalid).ok(), "invalid config rejected");
                     require(fixture.runner->calls.empty(), "no engine calls for bad arguments");
                   }});

  tests.push_back({"exit_124_without_sentinel_is_timeout", [] {
                     SessionFixture fixture;
                     auto created = fixture.make();
                     require(created.ok(), created.error());
                     auto &session = *created.value();
                     require(session.prepare().ok(), "prepare");
                     fixture.runner->set_execution_output("partial output\n", "", 124);
                     const auto result = session.execute("import time\ntime.sleep(100)");
                     require(result.timed_out, "timed_out expected");
                     require(!result.success, "timeout is a failure");
                     require(result.logs == "partial output\n", "raw logs kept");
                     require(result.error.has_value() &&
                                 result.error->find("timed out") != std::string::npos,
                             "timeout error message");
                     require(session.state() == sbx::SessionState::Ready,
                             "session usable after timeout");
                   }});

  tests.push_back({"user_exit_code_with_sentinel_is_not_timeout", [] {
                     SessionFixture fixture;
                     auto created = fixture.make();
                     require(created.ok(), created.error());
                     auto &session = *created.value();
                     require(session.prepare().ok(), "prepare");
                     fixture.runner->set_execution_output(
                         liteagent::testing::sentinel_output(
                             R"({"success": false, "error": "124", "traceback": "SystemExit: 124\n", "output": ""})"),
                         "", 0);
                     const auto result = session.execute("raise SystemExit(124)");
                     require(!result.timed_out, "not a timeout");
                     require(!result.success, "failure reported");
                     require(result.logs.find("SystemExit") != std::string::npos, "traceback logged");
                   }});

  tests.push_back({"docker_session_uses_docker_binary", [] {
                     SessionFixture fixture;
                     sbx::SessionConfig config;
                     config.engine = sbx::EngineKind::Docker;
                     config.filesystem_mode = sbx::FilesystemMode::ReadWrite;
                     auto created = fixture.make(config);
                     require(created.ok(), created.error());
                     require(created.value()->prepare().ok(), "prepare");
                     const auto *run = fixture.runner->find("run");
                     require(run != nullptr && run->binary == "docker", "docker binary");
                     const auto &mount = run->args[10];
                     require(mount.size() > 3 && mount.substr(mount.size() - 3) == ":rw",
                             "docker rw mount has no relabel");
                   }});

  tests.push_back({"concurrent_sessions_are_isolated", [] {
                     TempWorkspace source;
                     TempWorkspace temp_root;
                     source.create_file("shared.txt", "shared");
                     auto run_one = [&](int value) {
                       auto runner = std::make_shared<FakeEngineRunner>();
                       runner->set_execution_output(liteagent::testing::sentinel_output(
                           "{\"success\": true, \"result\": " + std::to_string(value) +
                           ", \"output\": \"\"}"));
                       auto created = sbx::ContainerSession::create(
                           source.path(), sbx::SessionConfig{}, sbx::make_driver(sbx::EngineKind::Podman),
                           runner, sbx::ShadowCopyManager(temp_root.path()));
                       if (!created.ok()) {
                         throw std::runtime_error(created.error());
                       }
                       auto &session = *created.value();
                       if (!session.prepare().ok()) {
                         throw std::runtime_error("prepare failed");
                       }
                       const auto names = std::make_pair(session.container_name(), session.shadow_dir());
                       const auto result = session.execute("_liteagent_result = " + std::to_string(value));
                       session.cleanup();
                       return std::make_tuple(names.first, names.second, result.result_json.value_or(""));
                     };
                     auto first = std::async(std::launch::async, run_one, 1);
                     auto second = std::async(std::launch::async, run_one, 2);
                     const auto a = first.get();
                     const auto b = second.get();
                     require(std::get<0>(a) != std::get<0>(b), "container names differ");
                     require(std::get<1>(a) != std::get<1>(b), "shadow dirs differ");
                     require(std::get<2>(a) == "1" && std::get<2>(b) == "2", "results not crossed");
                     require(std::filesystem::is_empty(temp_root.path()), "all shadows removed");
                   }});

  tests.push_back({"active_sessions_tracked", [] {
                     liteagent::testing::ScopedRecordingObserver scoped;
                     SessionFixture fixture;
                     const auto before = obs::active_sessions();
                     auto created = fixture.make();
                     require(created.ok(), created.error());
                     require(created.value()->prepare().ok(), "prepare");
                     require(obs::active_sessions() == before + 1, "prepared session counted");
                     created.value()->cleanup();
                     require(obs::active_sessions() == before, "cleaned session uncounted");
                     require(scoped.observer().events_of<obs::SessionPreparedEvent>().size() == 1,
                             "prepared event");
                     require(scoped.observer().events_of<obs::SessionCleanedEvent>().size() == 1,
                             "cleaned event");
                   }});

  tests.push_back({"factory_run_code_once", [] {
                     TempWorkspace source;
                     source.create_file("a.txt", "a");
                     auto runner = std::make_shared<FakeEngineRunner>();
                     runner->set_execution_output(liteagent::testing::sentinel_output(
                         R"({"success": true, "result": "done", "output": "ran\n"})"));
                     const sbx::ConfigurationFactory factory({}, runner);
                     const auto result = factory.run_code_once(source.path(), sbx::EngineKind::Docker,
                                                               "secure", {},
                                                               "```python\nprint('ran')\n```");
                     require(result.success, "success expected");
                     require(result.result_json == std::optional<std::string>("\"done\""), "result");
                     require(runner->live_containers.empty(), "container removed afterwards");
                     const auto *run = runner->find("run");
                     require(run != nullptr && run->args[5] == "512m", "secure template applied");
                     require(runner->count("install") == 1, "secure packages installed");
                   }});

  tests.push_back({"factory_run_code_once_reports_infrastructure_errors", [] {
                     TempWorkspace source;
                     auto runner = std::make_shared<FakeEngineRunner>();
                     runner->set_unavailable(true);
                     const sbx::ConfigurationFactory factory({}, runner);
                     const auto result = factory.run_code_once(source.path(), sbx::EngineKind::Podman,
                                                               "default", {}, "1 + 1");
                     require(!result.success, "failure expected");
                     require(result.logs.rfind("Error executing code: ", 0) == 0,
                             "infrastructure error prefix");
                     require(!result.result_json.has_value(), "no result");
                   }});
}

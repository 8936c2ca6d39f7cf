#include "liteagent/sandbox/factory.hpp"

#include "liteagent/observability/global.hpp"
#include "liteagent/sandbox/driver.hpp"
#include "liteagent/sandbox/templates.hpp"

namespace liteagent::sandbox {

namespace {

constexpr const char *COMPONENT = "factory";

ExecutionResult infrastructure_failure(const std::string &message) {
  ExecutionResult result;
  result.success = false;
  result.error = message;
  result.logs = "Error executing code: " + message;
  return result;
}

} // namespace

ConfigurationFactory::ConfigurationFactory(RuntimeSettings runtime,
                                           std::shared_ptr<IEngineRunner> runner)
    : runtime_(std::move(runtime)), runner_(std::move(runner)) {}

SessionConfig ConfigurationFactory::resolve(std::string_view template_name,
                                            const SessionOverrides &overrides,
                                            const EngineKind engine) const {
  const auto *tmpl = templates::find_template(template_name);
  if (tmpl == nullptr) {
    observability::record_warning(COMPONENT, "Unknown template '" + std::string(template_name) +
                                                 "', using '" +
                                                 std::string(templates::DEFAULT_TEMPLATE) + "'");
    tmpl = templates::find_template(templates::DEFAULT_TEMPLATE);
  }
  return apply_overrides(templates::to_session_config(*tmpl, engine, runtime_), overrides);
}

common::Result<std::unique_ptr<ContainerSession>>
ConfigurationFactory::create(const std::filesystem::path &source_dir, const EngineKind engine,
                             std::string_view template_name, const SessionOverrides &overrides) const {
  SessionConfig config = resolve(template_name, overrides, engine);
  return ContainerSession::create(source_dir, std::move(config), make_driver(engine), runner_);
}

ExecutionResult ConfigurationFactory::run_code_once(const std::filesystem::path &source_dir,
                                                    const EngineKind engine,
                                                    std::string_view template_name,
                                                    const SessionOverrides &overrides,
                                                    const std::string &code) const {
  auto session = create(source_dir, engine, template_name, overrides);
  if (!session.ok()) {
    return infrastructure_failure(session.error());
  }

  auto &container = *session.value();
  if (auto prepared = container.prepare(); !prepared.ok()) {
    container.cleanup();
    return infrastructure_failure(prepared.error());
  }

  ExecutionResult result = container.execute(extract_code_block(code));
  container.cleanup();
  return result;
}

} // namespace liteagent::sandbox

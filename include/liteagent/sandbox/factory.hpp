#pragma once

#include "liteagent/common/result.hpp"
#include "liteagent/sandbox/engine.hpp"
#include "liteagent/sandbox/result_protocol.hpp"
#include "liteagent/sandbox/session.hpp"
#include "liteagent/sandbox/session_config.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace liteagent::sandbox {

/// Builds sessions from a named template plus typed overrides.
class ConfigurationFactory {
public:
  explicit ConfigurationFactory(RuntimeSettings runtime = {},
                                std::shared_ptr<IEngineRunner> runner = std::make_shared<EngineCliRunner>());

  /// Unknown template names fall back to "default" with a warning.
  [[nodiscard]] SessionConfig resolve(std::string_view template_name,
                                      const SessionOverrides &overrides = {},
                                      EngineKind engine = EngineKind::Podman) const;

  [[nodiscard]] common::Result<std::unique_ptr<ContainerSession>>
  create(const std::filesystem::path &source_dir, EngineKind engine,
         std::string_view template_name, const SessionOverrides &overrides = {}) const;

  /// Create, prepare, execute and clean up in one call. Infrastructure failures
  /// are folded into the returned result instead of being propagated.
  [[nodiscard]] ExecutionResult run_code_once(const std::filesystem::path &source_dir,
                                              EngineKind engine, std::string_view template_name,
                                              const SessionOverrides &overrides,
                                              const std::string &code) const;

  [[nodiscard]] const RuntimeSettings &runtime() const { return runtime_; }

private:
  RuntimeSettings runtime_;
  std::shared_ptr<IEngineRunner> runner_;
};

} // namespace liteagent::sandbox

#pragma once

#include "liteagent/common/result.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace liteagent::sandbox {

struct EngineCommandOptions {
  /// Non-zero exits and timeouts come back as successful Results when set.
  bool allow_failure = false;
  std::chrono::milliseconds timeout{30'000};
};

struct EngineProcessResult {
  int exit_code = 0;
  bool timed_out = false;
  std::string stdout_text;
  std::string stderr_text;
};

/// Runs one container-engine CLI invocation to completion.
class IEngineRunner {
public:
  virtual ~IEngineRunner() = default;

  /// A binary that cannot be executed always fails with EngineUnavailable,
  /// regardless of allow_failure.
  [[nodiscard]] virtual common::Result<EngineProcessResult>
  run(const std::string &binary, const std::vector<std::string> &args,
      const EngineCommandOptions &options = {}) = 0;
};

class EngineCliRunner final : public IEngineRunner {
public:
  [[nodiscard]] common::Result<EngineProcessResult>
  run(const std::string &binary, const std::vector<std::string> &args,
      const EngineCommandOptions &options = {}) override;
};

[[nodiscard]] std::string join_command(const std::string &binary,
                                       const std::vector<std::string> &args);

} // namespace liteagent::sandbox

#pragma once

#include "liteagent/observability/observer.hpp"
#include "liteagent/sandbox/engine.hpp"

#include <cstddef>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace liteagent::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  EnvGuard(std::string key, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

  std::string key;
  std::optional<std::string> old_value;
};

struct FakeEngineCall {
  std::string binary;
  std::vector<std::string> args;
  sandbox::EngineCommandOptions options;
};

/// Stands in for the docker/podman CLI. Calls are keyed by subcommand: "--version",
/// "run", "install", "exec", "stop" and "rm".
class FakeEngineRunner final : public sandbox::IEngineRunner {
public:
  [[nodiscard]] common::Result<sandbox::EngineProcessResult>
  run(const std::string &binary, const std::vector<std::string> &args,
      const sandbox::EngineCommandOptions &options) override;

  void set_response(const std::string &key, sandbox::EngineProcessResult result);
  void set_execution_output(std::string stdout_text, std::string stderr_text = {},
                            int exit_code = 0);
  /// Every call fails as if the binary were missing from PATH.
  void set_unavailable(bool unavailable) { unavailable_ = unavailable; }

  [[nodiscard]] std::size_t count(const std::string &key) const;
  /// First recorded call for `key`, or nullptr.
  [[nodiscard]] const FakeEngineCall *find(const std::string &key) const;

  std::vector<FakeEngineCall> calls;
  std::set<std::string> live_containers;

private:
  [[nodiscard]] static std::string key_for(const std::vector<std::string> &args);

  std::map<std::string, sandbox::EngineProcessResult> responses_;
  bool unavailable_ = false;
  int next_id_ = 0;
};

/// Output of the in-container wrapper: the sentinel line followed by `json`.
[[nodiscard]] std::string sentinel_output(const std::string &json,
                                          const std::string &preamble = {});

/// Keeps every event and metric it is given.
class RecordingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "recording"; }

  template <typename T> [[nodiscard]] std::vector<T> events_of() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out;
    for (const auto &event : events_) {
      if (const auto *typed = std::get_if<T>(&event)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

  template <typename T> [[nodiscard]] std::vector<T> metrics_of() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<T> out;
    for (const auto &metric : metrics_) {
      if (const auto *typed = std::get_if<T>(&metric)) {
        out.push_back(*typed);
      }
    }
    return out;
  }

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a RecordingObserver as the global observer for its lifetime.
class ScopedRecordingObserver {
public:
  ScopedRecordingObserver();
  ~ScopedRecordingObserver();

  ScopedRecordingObserver(const ScopedRecordingObserver &) = delete;
  ScopedRecordingObserver &operator=(const ScopedRecordingObserver &) = delete;

  [[nodiscard]] RecordingObserver &observer() { return *observer_; }

private:
  RecordingObserver *observer_;
};

} // namespace liteagent::testing

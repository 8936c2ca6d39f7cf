#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace liteagent::observability {

struct DebugEvent {
  std::string component;
  std::string message;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

struct SessionPreparedEvent {
  std::string engine;
  std::string container_name;
  std::string container_id;
  std::string shadow_dir;
};

struct PackageInstallEvent {
  std::string engine;
  std::vector<std::string> packages;
  bool success = false;
};

struct ExecutionEvent {
  std::string engine;
  std::chrono::milliseconds duration{0};
  bool success = false;
  bool timed_out = false;
};

struct SessionCleanedEvent {
  std::string engine;
  bool container_removed = false;
  bool shadow_removed = false;
};

using ObserverEvent =
    std::variant<DebugEvent, WarningEvent, ErrorEvent, SessionPreparedEvent, PackageInstallEvent,
                 ExecutionEvent, SessionCleanedEvent>;

struct ExecutionLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ActiveSessionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<ExecutionLatencyMetric, ActiveSessionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace liteagent::observability

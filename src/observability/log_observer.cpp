#include "liteagent/observability/log_observer.hpp"

#include "liteagent/common/fs.hpp"

#include <iostream>
#include <type_traits>

namespace liteagent::observability {

namespace {

std::string join(const std::vector<std::string> &values) {
  std::string out;
  for (const auto &value : values) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += value;
  }
  return out;
}

std::string flag(const bool value) { return value ? "true" : "false"; }

} // namespace

std::string log_level_to_string(const LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "DEBUG";
  case LogLevel::Info:
    return "INFO";
  case LogLevel::Warn:
    return "WARN";
  case LogLevel::Error:
    return "ERROR";
  }
  return "INFO";
}

LogLevel parse_log_level(const std::string &value) {
  const std::string normalized = common::to_lower(common::trim(value));
  if (normalized == "debug" || normalized == "trace") {
    return LogLevel::Debug;
  }
  if (normalized == "warn" || normalized == "warning") {
    return LogLevel::Warn;
  }
  if (normalized == "error") {
    return LogLevel::Error;
  }
  return LogLevel::Info;
}

LogObserver::LogObserver(const LogLevel min_level) : out_(&std::cerr), min_level_(min_level) {}

LogObserver::LogObserver(std::ostream &out, const LogLevel min_level)
    : out_(&out), min_level_(min_level) {}

void LogObserver::log_line(const LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < static_cast<int>(min_level_)) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  *out_ << "[" << log_level_to_string(level) << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DebugEvent>) {
          log_line(LogLevel::Debug, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line(LogLevel::Warn, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(LogLevel::Error, evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, SessionPreparedEvent>) {
          log_line(LogLevel::Info, "session.prepared engine=" + evt.engine +
                                       " name=" + evt.container_name + " id=" + evt.container_id +
                                       " shadow=" + evt.shadow_dir);
        } else if constexpr (std::is_same_v<T, PackageInstallEvent>) {
          log_line(evt.success ? LogLevel::Debug : LogLevel::Warn,
                   "session.packages engine=" + evt.engine + " success=" + flag(evt.success) +
                       " packages=" + join(evt.packages));
        } else if constexpr (std::is_same_v<T, ExecutionEvent>) {
          log_line(LogLevel::Info, "session.execute engine=" + evt.engine +
                                       " success=" + flag(evt.success) +
                                       " timed_out=" + flag(evt.timed_out) +
                                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SessionCleanedEvent>) {
          log_line(LogLevel::Info, "session.cleaned engine=" + evt.engine +
                                       " container_removed=" + flag(evt.container_removed) +
                                       " shadow_removed=" + flag(evt.shadow_removed));
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ExecutionLatencyMetric>) {
          log_line(LogLevel::Debug, "metric.execution_latency_ms=" +
                                        std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ActiveSessionsMetric>) {
          log_line(LogLevel::Debug, "metric.active_sessions=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_->flush();
}

} // namespace liteagent::observability

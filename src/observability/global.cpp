#include "liteagent/observability/global.hpp"

#include <atomic>
#include <mutex>

namespace liteagent::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;
std::atomic<std::uint64_t> g_active_sessions{0};

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_debug(const std::string &component, const std::string &message) {
  record_event(DebugEvent{.component = component, .message = message});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

void record_session_prepared(const std::string &engine, const std::string &container_name,
                             const std::string &container_id, const std::string &shadow_dir) {
  record_event(SessionPreparedEvent{.engine = engine,
                                    .container_name = container_name,
                                    .container_id = container_id,
                                    .shadow_dir = shadow_dir});
}

void record_package_install(const std::string &engine, const std::vector<std::string> &packages,
                            const bool success) {
  record_event(PackageInstallEvent{.engine = engine, .packages = packages, .success = success});
}

void record_execution(const std::string &engine, std::chrono::milliseconds duration,
                      const bool success, const bool timed_out) {
  record_event(ExecutionEvent{
      .engine = engine, .duration = duration, .success = success, .timed_out = timed_out});
  record_metric(ExecutionLatencyMetric{.latency = duration});
}

void record_session_cleaned(const std::string &engine, const bool container_removed,
                            const bool shadow_removed) {
  record_event(SessionCleanedEvent{.engine = engine,
                                   .container_removed = container_removed,
                                   .shadow_removed = shadow_removed});
}

void session_opened() {
  const auto count = g_active_sessions.fetch_add(1) + 1;
  record_metric(ActiveSessionsMetric{.count = count});
}

void session_closed() {
  std::uint64_t current = g_active_sessions.load();
  while (current > 0 && !g_active_sessions.compare_exchange_weak(current, current - 1)) {
  }
  record_metric(ActiveSessionsMetric{.count = g_active_sessions.load()});
}

std::uint64_t active_sessions() { return g_active_sessions.load(); }

} // namespace liteagent::observability

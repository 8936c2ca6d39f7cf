#pragma once

#include "liteagent/observability/observer.hpp"

#include <memory>
#include <string>
#include <vector>

namespace liteagent::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_debug(const std::string &component, const std::string &message);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

void record_session_prepared(const std::string &engine, const std::string &container_name,
                             const std::string &container_id, const std::string &shadow_dir);
void record_package_install(const std::string &engine, const std::vector<std::string> &packages,
                            bool success);
void record_execution(const std::string &engine, std::chrono::milliseconds duration,
                      bool success, bool timed_out);
void record_session_cleaned(const std::string &engine, bool container_removed,
                            bool shadow_removed);

/// Tracks prepared-but-not-cleaned sessions and reports the new count.
void session_opened();
void session_closed();
[[nodiscard]] std::uint64_t active_sessions();

} // namespace liteagent::observability

#include "liteagent/observability/factory.hpp"

#include "liteagent/common/fs.hpp"
#include "liteagent/observability/log_observer.hpp"

namespace liteagent::observability {

namespace {

bool is_disabled(const std::string &backend) {
  return backend.empty() || backend == "none" || backend == "noop" || backend == "off";
}

} // namespace

bool is_known_backend(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  return is_disabled(normalized) || normalized == "log";
}

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (is_disabled(backend)) {
    return nullptr;
  }
  return std::make_unique<LogObserver>(parse_log_level(config.observability.log_level));
}

} // namespace liteagent::observability

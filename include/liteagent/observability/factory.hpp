#pragma once

#include "liteagent/config/schema.hpp"
#include "liteagent/observability/observer.hpp"

#include <memory>

namespace liteagent::observability {

/// nullptr for the "none" backend; every other value logs to stderr at the
/// configured level.
[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

/// Backend names accepted in [observability] backend.
[[nodiscard]] bool is_known_backend(const std::string &backend);

} // namespace liteagent::observability

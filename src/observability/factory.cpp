#include "remotegate/observability/factory.hpp"

#include "remotegate/common/strings.hpp"
#include "remotegate/observability/log_observer.hpp"
#include "remotegate/observability/multi_observer.hpp"
#include "remotegate/observability/noop_observer.hpp"

#include <sstream>

namespace remotegate::observability {

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }

  if (backend.empty() || backend == "log") {
    return std::make_unique<LogObserver>();
  }

  if (backend.find(',') != std::string::npos) {
    auto multi = std::make_unique<MultiObserver>();
    std::stringstream stream(backend);
    std::string part;
    while (std::getline(stream, part, ',')) {
      const std::string p = common::trim(part);
      if (p == "log") {
        multi->add(std::make_unique<LogObserver>());
      } else if (p == "noop" || p == "none") {
        multi->add(std::make_unique<NoopObserver>());
      }
    }
    return MultiObserver::collapse(std::move(multi));
  }

  return std::make_unique<LogObserver>();
}

} // namespace remotegate::observability

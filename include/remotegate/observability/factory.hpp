#pragma once

#include "remotegate/config/schema.hpp"
#include "remotegate/observability/observer.hpp"

#include <memory>

namespace remotegate::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace remotegate::observability

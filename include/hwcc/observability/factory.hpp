#pragma once

#include "hwcc/config/schema.hpp"
#include "hwcc/observability/observer.hpp"

#include <memory>

namespace hwcc::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::Config &config);

} // namespace hwcc::observability

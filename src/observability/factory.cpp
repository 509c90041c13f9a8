#include "hwcc/observability/factory.hpp"

#include "hwcc/common/fs.hpp"
#include "hwcc/observability/log_observer.hpp"
#include "hwcc/observability/multi_observer.hpp"

#include <sstream>
#include <vector>

namespace hwcc::observability {

namespace {

bool is_silent(const std::string &name) { return name == "none" || name == "noop"; }

} // namespace

std::unique_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));

  std::vector<std::string> names;
  std::stringstream stream(backend);
  std::string part;
  while (std::getline(stream, part, ',')) {
    if (auto name = common::trim(part); !name.empty()) {
      names.push_back(std::move(name));
    }
  }

  // Silent names contribute no backend. Any other name, known or not, logs,
  // so a typo never drops diagnostics.
  std::vector<std::unique_ptr<IObserver>> backends;
  for (const auto &name : names) {
    if (!is_silent(name)) {
      backends.push_back(std::make_unique<LogObserver>());
    }
  }
  if (backends.size() == 1) {
    return std::move(backends.front());
  }
  return std::make_unique<MultiObserver>(std::move(backends));
}

} // namespace hwcc::observability

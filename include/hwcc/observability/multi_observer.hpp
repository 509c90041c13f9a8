#pragma once

#include "hwcc/observability/observer.hpp"

#include <memory>
#include <vector>

namespace hwcc::observability {

// Fans events and metrics out to every backend in registration order. With
// no backends it discards everything, which is the "none" backend.
// Backends are flushed whenever a document finishes or fails, so a
// long batch leaves complete log lines behind each document.
class MultiObserver final : public IObserver {
public:
  MultiObserver() = default;
  explicit MultiObserver(std::vector<std::unique_ptr<IObserver>> backends);

  void add(std::unique_ptr<IObserver> observer);
  [[nodiscard]] std::size_t size() const { return backends_.size(); }
  [[nodiscard]] bool empty() const { return backends_.empty(); }

  void record_event(const ObserverEvent &event) override;
  void record_metric(const ObserverMetric &metric) override;
  void flush() override;
  [[nodiscard]] std::string_view name() const override { return empty() ? "none" : "multi"; }

private:
  std::vector<std::unique_ptr<IObserver>> backends_;
};

} // namespace hwcc::observability

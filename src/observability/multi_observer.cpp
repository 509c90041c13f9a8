#include "hwcc/observability/multi_observer.hpp"

namespace hwcc::observability {

namespace {

bool ends_document(const ObserverEvent &event) {
  return std::holds_alternative<DocumentChunkedEvent>(event) ||
         std::holds_alternative<ErrorEvent>(event);
}

} // namespace

MultiObserver::MultiObserver(std::vector<std::unique_ptr<IObserver>> backends) {
  for (auto &backend : backends) {
    add(std::move(backend));
  }
}

void MultiObserver::add(std::unique_ptr<IObserver> observer) {
  if (observer != nullptr) {
    backends_.push_back(std::move(observer));
  }
}

void MultiObserver::record_event(const ObserverEvent &event) {
  for (auto &backend : backends_) {
    backend->record_event(event);
  }
  if (ends_document(event)) {
    flush();
  }
}

void MultiObserver::record_metric(const ObserverMetric &metric) {
  for (auto &backend : backends_) {
    backend->record_metric(metric);
  }
}

void MultiObserver::flush() {
  for (auto &backend : backends_) {
    backend->flush();
  }
}

} // namespace hwcc::observability

#include "hwcc/observability/global.hpp"

#include <mutex>

namespace hwcc::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->flush();
  }
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

// Dispatch happens under the lock: chunk() may run on several workers at once.
void record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer != nullptr) {
    g_observer->record_metric(metric);
  }
}

void record_document_chunked(const std::string &doc_id, const std::uint64_t chunks,
                             const int max_tokens, const int overlap_tokens,
                             const std::chrono::milliseconds duration) {
  record_event(DocumentChunkedEvent{.doc_id = doc_id,
                                    .chunks = chunks,
                                    .max_tokens = max_tokens,
                                    .overlap_tokens = overlap_tokens,
                                    .duration = duration});
}

void record_tokenizer_loaded(const std::string &backend, const std::uint64_t vocab_size) {
  record_event(TokenizerLoadedEvent{.backend = backend, .vocab_size = vocab_size});
}

void record_oversized_atomic_block(const std::string &doc_id, const std::uint64_t tokens,
                                   const int max_tokens) {
  record_event(
      OversizedAtomicBlockEvent{.doc_id = doc_id, .tokens = tokens, .max_tokens = max_tokens});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace hwcc::observability

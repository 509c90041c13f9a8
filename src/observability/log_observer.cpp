#include "hwcc/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace hwcc::observability {

namespace {

void log_line(std::ostream &out, const std::string &level, const std::string &message) {
  out << "[" << level << "] " << message << "\n";
}

} // namespace

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::record_event(const ObserverEvent &event) {
  std::ostream &out = *out_;
  std::visit(
      [&out](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, DocumentChunkedEvent>) {
          log_line(out, "INFO",
                   "chunk.done doc=" + evt.doc_id + " chunks=" + std::to_string(evt.chunks) +
                       " max_tokens=" + std::to_string(evt.max_tokens) +
                       " overlap=" + std::to_string(evt.overlap_tokens) +
                       " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, TokenizerLoadedEvent>) {
          log_line(out, "INFO",
                   "tokenizer.loaded backend=" + evt.backend +
                       " vocab_size=" + std::to_string(evt.vocab_size));
        } else if constexpr (std::is_same_v<T, OversizedAtomicBlockEvent>) {
          log_line(out, "DEBUG",
                   "chunk.oversized_atomic doc=" + evt.doc_id +
                       " tokens=" + std::to_string(evt.tokens) +
                       " max_tokens=" + std::to_string(evt.max_tokens));
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line(out, "ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::ostream &out = *out_;
  std::visit(
      [&out](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, ChunkLatencyMetric>) {
          log_line(out, "DEBUG", "metric.chunk_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, ChunksProducedMetric>) {
          log_line(out, "DEBUG", "metric.chunks_produced=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, TokensChunkedMetric>) {
          log_line(out, "DEBUG", "metric.tokens_chunked=" + std::to_string(m.tokens));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace hwcc::observability

#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace hwcc::observability {

struct DocumentChunkedEvent {
  std::string doc_id;
  std::uint64_t chunks = 0;
  int max_tokens = 0;
  int overlap_tokens = 0;
  std::chrono::milliseconds duration{0};
};

struct TokenizerLoadedEvent {
  std::string backend;
  std::uint64_t vocab_size = 0;
};

struct OversizedAtomicBlockEvent {
  std::string doc_id;
  std::uint64_t tokens = 0;
  int max_tokens = 0;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<DocumentChunkedEvent, TokenizerLoadedEvent, OversizedAtomicBlockEvent, ErrorEvent>;

struct ChunkLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct ChunksProducedMetric {
  std::uint64_t count = 0;
};

struct TokensChunkedMetric {
  std::uint64_t tokens = 0;
};

using ObserverMetric = std::variant<ChunkLatencyMetric, ChunksProducedMetric, TokensChunkedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace hwcc::observability

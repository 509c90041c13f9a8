#pragma once

#include "hwcc/observability/observer.hpp"

#include <memory>

namespace hwcc::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_document_chunked(const std::string &doc_id, std::uint64_t chunks, int max_tokens,
                             int overlap_tokens, std::chrono::milliseconds duration);
void record_tokenizer_loaded(const std::string &backend, std::uint64_t vocab_size);
void record_oversized_atomic_block(const std::string &doc_id, std::uint64_t tokens,
                                   int max_tokens);
void record_error(const std::string &component, const std::string &message);

} // namespace hwcc::observability

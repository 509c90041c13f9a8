#include "bench_common.hpp"

#include "hwcc/chunk/batch.hpp"
#include "hwcc/chunk/bpe_tokenizer.hpp"
#include "hwcc/chunk/chunker.hpp"

#include <vector>

void run_chunk_benchmark() {
  hwcc::chunk::MarkdownChunker chunker(hwcc::chunk::BpeTokenizer::builtin());
  const hwcc::chunk::ChunkConfig config;

  hwcc::chunk::Document document;
  document.doc_id = "bench_manual";
  document.doc_type = "pdf";
  document.chip = "STM32F407";
  document.content = hwcc::bench::make_manual(40);

  hwcc::bench::run_bench("chunk_document", 20, [&] { (void)chunker.chunk(document, config); },
                         document.content.size());

  hwcc::chunk::ChunkConfig small = config;
  small.max_tokens = 128;
  small.overlap_tokens = 16;
  small.min_tokens = 16;
  hwcc::bench::run_bench("chunk_document_small_budget", 20,
                         [&] { (void)chunker.chunk(document, small); },
                         document.content.size());

  std::vector<hwcc::chunk::Document> documents(16, document);
  for (std::size_t i = 0; i < documents.size(); ++i) {
    documents[i].doc_id = "bench_manual_" + std::to_string(i);
  }
  hwcc::bench::run_bench("chunk_documents_parallel", 5,
                         [&] { (void)hwcc::chunk::chunk_documents(chunker, documents, config); },
                         document.content.size() * documents.size());
}

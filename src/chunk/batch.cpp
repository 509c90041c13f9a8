#include "hwcc/chunk/batch.hpp"

#include <algorithm>
#include <future>
#include <thread>

namespace hwcc::chunk {

namespace {

std::size_t resolve_workers(const std::size_t requested) {
  if (requested > 0) {
    return requested;
  }
  return std::max<std::size_t>(std::thread::hardware_concurrency(), 1);
}

} // namespace

std::vector<ChunkResult> chunk_documents(const IChunker &chunker,
                                         const std::vector<Document> &documents,
                                         const ChunkConfig &config,
                                         const std::size_t max_workers) {
  std::vector<ChunkResult> results;
  results.reserve(documents.size());

  const std::size_t workers = resolve_workers(max_workers);
  for (std::size_t begin = 0; begin < documents.size(); begin += workers) {
    const std::size_t end = std::min(begin + workers, documents.size());

    std::vector<std::future<ChunkResult>> futures;
    futures.reserve(end - begin);
    for (std::size_t i = begin; i < end; ++i) {
      futures.push_back(std::async(std::launch::async, [&chunker, &document = documents[i],
                                                        &config]() {
        return chunker.chunk(document, config);
      }));
    }

    for (auto &future : futures) {
      results.push_back(future.get());
    }
  }

  return results;
}

} // namespace hwcc::chunk

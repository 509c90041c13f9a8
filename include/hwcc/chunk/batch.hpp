#pragma once

#include "hwcc/chunk/chunker.hpp"

#include <cstddef>
#include <vector>

namespace hwcc::chunk {

// Chunks documents concurrently, at most max_workers at a time (0 means one
// per hardware thread). Results come back in input order; a failing document
// does not affect the others.
[[nodiscard]] std::vector<ChunkResult> chunk_documents(const IChunker &chunker,
                                                       const std::vector<Document> &documents,
                                                       const ChunkConfig &config,
                                                       std::size_t max_workers = 0);

} // namespace hwcc::chunk

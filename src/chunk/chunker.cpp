#include "hwcc/chunk/chunker.hpp"

#include "hwcc/chunk/markup.hpp"
#include "hwcc/chunk/overlap.hpp"
#include "hwcc/chunk/recursive_splitter.hpp"
#include "hwcc/chunk/section_path.hpp"
#include "hwcc/chunk/segment_extractor.hpp"
#include "hwcc/chunk/small_chunk_merger.hpp"
#include "hwcc/common/fs.hpp"
#include "hwcc/common/hash.hpp"
#include "hwcc/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <iomanip>
#include <iterator>
#include <optional>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>

namespace hwcc::chunk {

namespace {

std::optional<std::string> invalid_config_reason(const ChunkConfig &config) {
  if (config.max_tokens < 1) {
    return "max_tokens must be >= 1, got " + std::to_string(config.max_tokens);
  }
  if (config.overlap_tokens < 0) {
    return "overlap_tokens must be >= 0, got " + std::to_string(config.overlap_tokens);
  }
  if (config.min_tokens < 0) {
    return "min_tokens must be >= 0, got " + std::to_string(config.min_tokens);
  }
  return std::nullopt;
}

// Leaves room for the overlap prefix so the final chunk still fits max_tokens.
int split_budget(const ChunkConfig &config) {
  if (config.overlap_tokens <= 0) {
    return config.max_tokens;
  }
  return std::max(config.max_tokens - config.overlap_tokens, 1);
}

} // namespace

std::string make_chunk_id(const std::string &doc_id, const std::size_t index,
                          const std::string_view content) {
  std::ostringstream id;
  id << doc_id << "_chunk_" << std::setw(4) << std::setfill('0') << index << "_"
     << common::sha256_hex(content).substr(0, 8);
  return id.str();
}

MarkdownChunker::MarkdownChunker(std::shared_ptr<const ITokenizer> tokenizer)
    : tokenizer_(std::move(tokenizer)) {
  if (tokenizer_ == nullptr) {
    throw std::invalid_argument("MarkdownChunker requires a tokenizer");
  }
}

ChunkResult MarkdownChunker::chunk(const Document &document, const ChunkConfig &config) const {
  if (const auto reason = invalid_config_reason(config); reason.has_value()) {
    observability::record_error("chunk", "document " + document.doc_id + ": " + *reason);
    return ChunkResult::failure(ChunkError{.doc_id = document.doc_id, .cause = *reason});
  }

  const auto started = std::chrono::steady_clock::now();
  try {
    auto chunks = chunk_unchecked(document, config);

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    std::uint64_t tokens = 0;
    for (const auto &c : chunks) {
      tokens += static_cast<std::uint64_t>(c.token_count);
    }
    observability::record_document_chunked(document.doc_id, chunks.size(), config.max_tokens,
                                            config.overlap_tokens, elapsed);
    observability::record_metric(observability::ChunkLatencyMetric{.latency = elapsed});
    observability::record_metric(observability::ChunksProducedMetric{.count = chunks.size()});
    observability::record_metric(observability::TokensChunkedMetric{.tokens = tokens});

    return ChunkResult::success(std::move(chunks));
  } catch (const std::exception &ex) {
    const ChunkError error{.doc_id = document.doc_id, .cause = ex.what()};
    observability::record_error("chunk", error.message());
    return ChunkResult::failure(error);
  }
}

std::vector<Chunk> MarkdownChunker::chunk_unchecked(const Document &document,
                                                    const ChunkConfig &config) const {
  const std::string content = common::trim(document.content);
  if (content.empty()) {
    return {};
  }

  const ITokenizer &tokenizer = *tokenizer_;
  const RecursiveSplitter splitter(tokenizer);
  const int budget = split_budget(config);

  // Atomic segments pass through whole; everything else is split to budget.
  std::vector<std::string> pieces;
  std::set<std::size_t> atomic_indices;
  for (const auto &segment : extract_segments(content)) {
    std::string text = common::trim(segment.text);
    if (text.empty()) {
      continue;
    }

    if (segment.is_atomic) {
      if (const int tokens = tokenizer.count(text); tokens > config.max_tokens) {
        observability::record_oversized_atomic_block(
            document.doc_id, static_cast<std::uint64_t>(tokens), config.max_tokens);
      }
      atomic_indices.insert(pieces.size());
      pieces.push_back(std::move(text));
      continue;
    }

    auto splits = splitter.split(text, budget);
    pieces.insert(pieces.end(), std::make_move_iterator(splits.begin()),
                  std::make_move_iterator(splits.end()));
  }

  pieces = apply_overlap(tokenizer, pieces, config.overlap_tokens, atomic_indices);
  pieces = merge_small_chunks(tokenizer, pieces, config.min_tokens, config.max_tokens);

  SectionPathTracker sections;
  std::vector<Chunk> chunks;
  chunks.reserve(pieces.size());

  // The index counts every piece, including those dropped below.
  for (std::size_t index = 0; index < pieces.size(); ++index) {
    const std::string trimmed = common::trim(pieces[index]);
    if (trimmed.empty()) {
      continue;
    }

    const std::int64_t page = first_page_marker(trimmed).value_or(0);
    std::string text = common::trim(strip_page_markers(trimmed));
    if (text.empty()) {
      continue;
    }

    sections.update(text);

    Chunk chunk;
    chunk.chunk_id = make_chunk_id(document.doc_id, index, text);
    chunk.token_count = tokenizer.count(text);
    chunk.metadata.doc_id = document.doc_id;
    chunk.metadata.doc_type = document.doc_type;
    chunk.metadata.chip = document.chip;
    chunk.metadata.section_path = sections.path();
    chunk.metadata.page = page;
    chunk.metadata.content_type = classifier_.classify_label(text);
    chunk.content = std::move(text);
    chunks.push_back(std::move(chunk));
  }

  return chunks;
}

} // namespace hwcc::chunk

#pragma once

#include "hwcc/chunk/content_classifier.hpp"
#include "hwcc/chunk/tokenizer.hpp"
#include "hwcc/chunk/types.hpp"
#include "hwcc/common/result.hpp"

#include <memory>
#include <string_view>
#include <vector>

namespace hwcc::chunk {

using ChunkResult = common::Result<std::vector<Chunk>, ChunkError>;

class IChunker {
public:
  virtual ~IChunker() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  // Empty content yields an empty list. Any internal failure yields a
  // ChunkError naming the document; partial output is never returned.
  [[nodiscard]] virtual ChunkResult chunk(const Document &document,
                                          const ChunkConfig &config) const = 0;
};

// Markdown-aware chunker:
//  - fenced blocks and pipe tables are never split, even when oversized
//  - heading boundaries are the preferred split points
//  - adjacent non-atomic chunks share an overlap of tokens
//  - chunks under min_tokens are merged into neighbours when they fit
//  - every chunk records its heading path, page and content type
class MarkdownChunker final : public IChunker {
public:
  explicit MarkdownChunker(std::shared_ptr<const ITokenizer> tokenizer);

  [[nodiscard]] std::string_view name() const override { return "markdown"; }
  [[nodiscard]] ChunkResult chunk(const Document &document,
                                  const ChunkConfig &config) const override;

  [[nodiscard]] const ITokenizer &tokenizer() const { return *tokenizer_; }

private:
  [[nodiscard]] std::vector<Chunk> chunk_unchecked(const Document &document,
                                                   const ChunkConfig &config) const;

  std::shared_ptr<const ITokenizer> tokenizer_;
  ContentTypeClassifier classifier_;
};

// "<doc_id>_chunk_<index, 4 digits>_<first 8 hex chars of sha256(content)>"
[[nodiscard]] std::string make_chunk_id(const std::string &doc_id, std::size_t index,
                                        std::string_view content);

} // namespace hwcc::chunk

#include "hwcc/chunk/small_chunk_merger.hpp"

namespace hwcc::chunk {

namespace {

constexpr const char *kMergeSeparator = "\n\n";

} // namespace

std::vector<std::string> merge_small_chunks(const ITokenizer &tokenizer,
                                            const std::vector<std::string> &chunks,
                                            const int min_tokens, const int max_tokens) {
  if (chunks.empty() || min_tokens <= 0) {
    return chunks;
  }

  std::vector<std::string> result;
  std::string current;

  for (const auto &chunk : chunks) {
    if (current.empty()) {
      current = chunk;
      continue;
    }

    if (tokenizer.count(current) < min_tokens) {
      std::string merged = current + kMergeSeparator + chunk;
      if (tokenizer.count(merged) <= max_tokens) {
        current = std::move(merged);
        continue;
      }
    }
    result.push_back(std::move(current));
    current = chunk;
  }

  if (current.empty()) {
    return result;
  }

  if (!result.empty() && tokenizer.count(current) < min_tokens) {
    std::string merged = result.back() + kMergeSeparator + current;
    if (tokenizer.count(merged) <= max_tokens) {
      result.back() = std::move(merged);
      return result;
    }
  }
  result.push_back(std::move(current));
  return result;
}

} // namespace hwcc::chunk

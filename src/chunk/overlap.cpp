#include "hwcc/chunk/overlap.hpp"

namespace hwcc::chunk {

std::vector<std::string> apply_overlap(const ITokenizer &tokenizer,
                                       const std::vector<std::string> &chunks,
                                       const int overlap_tokens,
                                       const std::set<std::size_t> &atomic_indices) {
  if (overlap_tokens <= 0 || chunks.size() <= 1) {
    return chunks;
  }

  const auto overlap = static_cast<std::size_t>(overlap_tokens);
  std::vector<std::string> result;
  result.reserve(chunks.size());
  result.push_back(chunks.front());

  for (std::size_t i = 1; i < chunks.size(); ++i) {
    if (atomic_indices.contains(i)) {
      result.push_back(chunks[i]);
      continue;
    }

    // Overlap comes from the previous chunk as split, not as already extended.
    const auto previous = tokenizer.encode(chunks[i - 1]);
    if (previous.size() <= overlap) {
      result.push_back(chunks[i]);
      continue;
    }

    // The tail starts on a code point, so it may come out a few tokens short.
    const std::span<const Token> all(previous);
    std::size_t from = previous.size() - overlap;
    while (from < previous.size()) {
      const std::string lead = tokenizer.decode_bytes(all.subspan(from, 1));
      if (lead.empty() || !is_continuation_byte(lead.front())) {
        break;
      }
      ++from;
    }
    if (from == previous.size()) {
      result.push_back(chunks[i]);
      continue;
    }
    result.push_back(tokenizer.decode(all.subspan(from)) + chunks[i]);
  }

  return result;
}

} // namespace hwcc::chunk

#pragma once

#include "hwcc/chunk/tokenizer.hpp"

#include <set>
#include <string>
#include <vector>

namespace hwcc::chunk {

// Prepends the decoded last overlap_tokens tokens of chunk i-1 to chunk i.
// Atomic chunks pass through untouched, and nothing is added when the
// previous chunk is not longer than the overlap.
[[nodiscard]] std::vector<std::string> apply_overlap(const ITokenizer &tokenizer,
                                                     const std::vector<std::string> &chunks,
                                                     int overlap_tokens,
                                                     const std::set<std::size_t> &atomic_indices);

} // namespace hwcc::chunk

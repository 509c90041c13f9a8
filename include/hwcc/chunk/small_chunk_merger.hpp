#pragma once

#include "hwcc/chunk/tokenizer.hpp"

#include <string>
#include <vector>

namespace hwcc::chunk {

// Folds chunks shorter than min_tokens into their right neighbour (joined by
// a blank line) while the result stays within max_tokens. A short final chunk
// is folded back into its predecessor when that fits, else kept as is.
[[nodiscard]] std::vector<std::string> merge_small_chunks(const ITokenizer &tokenizer,
                                                          const std::vector<std::string> &chunks,
                                                          int min_tokens, int max_tokens);

} // namespace hwcc::chunk

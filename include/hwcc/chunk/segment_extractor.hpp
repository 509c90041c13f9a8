#pragma once

#include "hwcc/chunk/types.hpp"

#include <string_view>
#include <vector>

namespace hwcc::chunk {

// Splits a document into ordered segments. Fenced blocks (fences included)
// and pipe tables that carry a separator row become atomic segments; pipe
// runs without a separator row stay ordinary text. Concatenating the
// segment texts with '\n' reproduces the input.
[[nodiscard]] std::vector<Segment> extract_segments(std::string_view text);

} // namespace hwcc::chunk

#pragma once

#include "hwcc/common/result.hpp"

#include <string>
#include <string_view>

namespace hwcc::common {

// Lowercase hex SHA-256 of the raw bytes of text.
[[nodiscard]] std::string sha256_hex(std::string_view text);

// Standard (padded) base64. Whitespace is not accepted.
[[nodiscard]] Result<std::string> base64_decode(std::string_view encoded);

} // namespace hwcc::common

#pragma once

#include "hwcc/common/result.hpp"
#include "hwcc/config/schema.hpp"

#include <cstdint>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace hwcc::chunk {

using Token = std::uint32_t;

// Implementations are immutable after construction and safe to share
// across threads.
class ITokenizer {
public:
  virtual ~ITokenizer() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::vector<Token> encode(std::string_view text) const = 0;
  // Raw token bytes. A slice of a sequence may end inside a code point.
  [[nodiscard]] virtual std::string decode_bytes(std::span<const Token> tokens) const = 0;
  // Valid UTF-8; malformed bytes become U+FFFD.
  [[nodiscard]] virtual std::string decode(std::span<const Token> tokens) const = 0;
  [[nodiscard]] virtual std::size_t vocab_size() const = 0;

  [[nodiscard]] virtual int count(std::string_view text) const {
    return text.empty() ? 0 : static_cast<int>(encode(text).size());
  }
};

// False when the last UTF-8 sequence in bytes is cut short. Malformed tails
// count as complete, since no later byte can repair them.
[[nodiscard]] bool ends_on_code_point(std::string_view bytes);
[[nodiscard]] bool is_continuation_byte(char byte);

// Largest end in (begin, end] where tokens[begin, end) decodes to whole code
// points, or 0 when even the first token leaves a code point open.
[[nodiscard]] std::size_t code_point_end(const ITokenizer &tokenizer,
                                         std::span<const Token> tokens, std::size_t begin,
                                         std::size_t end);

[[nodiscard]] common::Result<std::shared_ptr<const ITokenizer>>
create_tokenizer(const config::TokenizerConfig &config);

} // namespace hwcc::chunk

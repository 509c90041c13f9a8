#include "hwcc/chunk/tokenizer.hpp"

#include "hwcc/chunk/bpe_tokenizer.hpp"
#include "hwcc/common/fs.hpp"
#include "hwcc/observability/global.hpp"

namespace hwcc::chunk {

bool is_continuation_byte(const char byte) {
  return (static_cast<unsigned char>(byte) & 0xC0) == 0x80;
}

bool ends_on_code_point(const std::string_view bytes) {
  std::size_t lead = bytes.size();
  std::size_t trailing = 0;
  while (lead > 0 && trailing < 4 && is_continuation_byte(bytes[lead - 1])) {
    --lead;
    ++trailing;
  }
  if (lead == 0 || trailing >= 4) {
    return true;
  }
  const auto byte = static_cast<unsigned char>(bytes[lead - 1]);
  std::size_t expected = 0;
  if (byte >= 0xC2 && byte <= 0xDF) {
    expected = 1;
  } else if (byte >= 0xE0 && byte <= 0xEF) {
    expected = 2;
  } else if (byte >= 0xF0 && byte <= 0xF4) {
    expected = 3;
  }
  return trailing >= expected;
}

std::size_t code_point_end(const ITokenizer &tokenizer, const std::span<const Token> tokens,
                           const std::size_t begin, std::size_t end) {
  // A code point spans at most four bytes and every token holds at least
  // one, so the last four tokens decide whether the window ends cleanly.
  while (end > begin) {
    const std::size_t from = end - begin > 4 ? end - 4 : begin;
    if (ends_on_code_point(tokenizer.decode_bytes(tokens.subspan(from, end - from)))) {
      return end;
    }
    --end;
  }
  return 0;
}

common::Result<std::shared_ptr<const ITokenizer>>
create_tokenizer(const config::TokenizerConfig &config) {
  using ResultT = common::Result<std::shared_ptr<const ITokenizer>>;
  const std::string backend = common::to_lower(common::trim(config.backend));

  if (backend.empty() || backend == "builtin") {
    auto tokenizer = BpeTokenizer::builtin();
    observability::record_tokenizer_loaded("builtin", tokenizer->vocab_size());
    return ResultT::success(std::move(tokenizer));
  }

  if (backend == "tiktoken") {
    const std::string path = common::trim(config.vocab_path);
    if (path.empty()) {
      return ResultT::failure("tokenizer.vocab_path is required for the tiktoken backend");
    }
    auto loaded = BpeTokenizer::from_tiktoken_file(common::expand_path(path));
    if (!loaded.ok()) {
      observability::record_error("tokenizer", loaded.error());
      return ResultT::failure("Failed to load tokenizer vocabulary " + path + ": " +
                              loaded.error());
    }
    observability::record_tokenizer_loaded(std::string(loaded.value()->name()),
                                           loaded.value()->vocab_size());
    return ResultT::success(loaded.value());
  }

  return ResultT::failure("Unknown tokenizer backend: " + config.backend);
}

} // namespace hwcc::chunk

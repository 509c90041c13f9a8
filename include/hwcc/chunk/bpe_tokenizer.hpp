#pragma once

#include "hwcc/chunk/tokenizer.hpp"

#include <filesystem>
#include <optional>
#include <unordered_map>

namespace hwcc::chunk {

// Splits text into the pieces BPE merges never cross: contractions, letter
// runs, digit groups of up to three, punctuation runs and whitespace runs.
// Follows the cl100k pre-tokenizer; non-ASCII letters and digits are
// approximated by code point class.
[[nodiscard]] std::vector<std::string_view> pretokenize(std::string_view text);

class BpeTokenizer final : public ITokenizer {
public:
  using RankMap = std::unordered_map<std::string, Token>;

  // Every single byte must have a rank, otherwise some input could not be encoded.
  [[nodiscard]] static common::Result<std::shared_ptr<const BpeTokenizer>>
  create(std::string name, RankMap ranks);

  // Parses "<base64 bytes> <rank>" lines (the tiktoken vocabulary format).
  [[nodiscard]] static common::Result<std::shared_ptr<const BpeTokenizer>>
  from_tiktoken(std::string_view content, std::string name = "tiktoken");
  [[nodiscard]] static common::Result<std::shared_ptr<const BpeTokenizer>>
  from_tiktoken_file(const std::filesystem::path &path);

  // Self-contained vocabulary: all single bytes plus every printable ASCII bigram.
  [[nodiscard]] static std::shared_ptr<const BpeTokenizer> builtin();

  [[nodiscard]] std::string_view name() const override { return name_; }
  [[nodiscard]] std::vector<Token> encode(std::string_view text) const override;
  [[nodiscard]] std::string decode_bytes(std::span<const Token> tokens) const override;
  [[nodiscard]] std::string decode(std::span<const Token> tokens) const override;
  [[nodiscard]] std::size_t vocab_size() const override { return ranks_.size(); }

private:
  BpeTokenizer(std::string name, RankMap ranks);

  void encode_piece(std::string_view piece, std::vector<Token> &out) const;
  [[nodiscard]] std::optional<Token> rank_of(std::string_view bytes) const;

  std::string name_;
  RankMap ranks_;
  std::vector<std::optional<std::string>> decoder_;
};

} // namespace hwcc::chunk

#include "hwcc/chunk/bpe_tokenizer.hpp"

#include "hwcc/common/fs.hpp"
#include "hwcc/common/hash.hpp"
#include "hwcc/common/toml.hpp"

#include <algorithm>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace hwcc::chunk {

namespace {

constexpr char32_t kInvalidCodepoint = 0xFFFD;
constexpr const char *kReplacementUtf8 = "\xEF\xBF\xBD";

struct Codepoint {
  char32_t value = 0;
  std::size_t length = 0;
};

// Length of the well-formed UTF-8 sequence at pos, or 0 when malformed.
std::size_t utf8_sequence_length(const std::string_view text, const std::size_t pos) {
  const auto lead = static_cast<unsigned char>(text[pos]);
  std::size_t length = 0;
  if (lead < 0x80) {
    return 1;
  }
  if (lead >= 0xC2 && lead <= 0xDF) {
    length = 2;
  } else if (lead >= 0xE0 && lead <= 0xEF) {
    length = 3;
  } else if (lead >= 0xF0 && lead <= 0xF4) {
    length = 4;
  } else {
    return 0;
  }
  if (pos + length > text.size()) {
    return 0;
  }
  for (std::size_t i = 1; i < length; ++i) {
    if ((static_cast<unsigned char>(text[pos + i]) & 0xC0) != 0x80) {
      return 0;
    }
  }
  const auto second = static_cast<unsigned char>(text[pos + 1]);
  if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F) ||
      (lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
    return 0;
  }
  return length;
}

Codepoint decode_codepoint(const std::string_view text, const std::size_t pos) {
  const std::size_t length = utf8_sequence_length(text, pos);
  if (length == 0) {
    return {kInvalidCodepoint, 1};
  }
  const auto lead = static_cast<unsigned char>(text[pos]);
  if (length == 1) {
    return {lead, 1};
  }
  char32_t value = lead & (0xFF >> (length + 1));
  for (std::size_t i = 1; i < length; ++i) {
    value = (value << 6) | (static_cast<unsigned char>(text[pos + i]) & 0x3F);
  }
  return {value, length};
}

bool is_newline(const char32_t c) { return c == U'\n' || c == U'\r'; }

bool is_space(const char32_t c) {
  return c == U' ' || c == U'\t' || c == U'\n' || c == U'\r' || c == U'\v' || c == U'\f' ||
         c == 0x85 || c == 0xA0 || c == 0x1680 || (c >= 0x2000 && c <= 0x200A) ||
         c == 0x2028 || c == 0x2029 || c == 0x202F || c == 0x205F || c == 0x3000;
}

bool is_digit(const char32_t c) { return c >= U'0' && c <= U'9'; }

bool is_letter(const char32_t c) {
  if (c < 0x80) {
    return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
  }
  if (c == kInvalidCodepoint || is_space(c)) {
    return false;
  }
  // Latin-1 punctuation and symbols, except the feminine/masculine ordinals and micro sign.
  if (c >= 0xA1 && c <= 0xBF) {
    return c == 0xAA || c == 0xB5 || c == 0xBA;
  }
  if (c == 0xD7 || c == 0xF7) {
    return false;
  }
  // General punctuation, arrows/math/box drawing, CJK punctuation.
  if ((c >= 0x2010 && c <= 0x2BFF) || (c >= 0x3000 && c <= 0x303F)) {
    return false;
  }
  return true;
}

bool is_other(const char32_t c) { return !is_space(c) && !is_letter(c) && !is_digit(c); }

class PieceScanner {
public:
  explicit PieceScanner(std::string_view text) : text_(text) {}

  [[nodiscard]] bool done() const { return pos_ >= text_.size(); }

  std::string_view next() {
    const std::size_t start = pos_;
    const std::size_t end = scan(start);
    pos_ = end;
    return text_.substr(start, end - start);
  }

private:
  [[nodiscard]] Codepoint at(const std::size_t pos) const {
    if (pos >= text_.size()) {
      return {0, 0};
    }
    return decode_codepoint(text_, pos);
  }

  [[nodiscard]] std::size_t skip_while(std::size_t pos, bool (*pred)(char32_t),
                                       std::size_t limit = std::numeric_limits<std::size_t>::max()) const {
    std::size_t taken = 0;
    while (pos < text_.size() && taken < limit) {
      const auto cp = at(pos);
      if (!pred(cp.value)) {
        break;
      }
      pos += cp.length;
      ++taken;
    }
    return pos;
  }

  [[nodiscard]] std::size_t contraction(const std::size_t start) const {
    if (text_[start] != '\'') {
      return 0;
    }
    const std::string rest = common::to_lower(std::string(text_.substr(start + 1, 2)));
    if (rest.size() == 2 && (rest == "re" || rest == "ve" || rest == "ll")) {
      return 3;
    }
    if (!rest.empty() &&
        (rest[0] == 's' || rest[0] == 't' || rest[0] == 'm' || rest[0] == 'd')) {
      return 2;
    }
    return 0;
  }

  [[nodiscard]] std::size_t scan(const std::size_t start) const {
    if (const std::size_t length = contraction(start); length > 0) {
      return start + length;
    }

    const auto first = at(start);

    if (is_letter(first.value)) {
      return skip_while(start, is_letter);
    }
    if (!is_newline(first.value) && !is_digit(first.value) &&
        is_letter(at(start + first.length).value)) {
      return skip_while(start + first.length, is_letter);
    }

    if (is_digit(first.value)) {
      return skip_while(start, is_digit, 3);
    }

    std::size_t punct_start = start;
    if (first.value == U' ' && is_other(at(start + first.length).value)) {
      punct_start = start + first.length;
    }
    if (is_other(at(punct_start).value)) {
      const std::size_t end = skip_while(punct_start, is_other);
      return skip_while(end, is_newline);
    }

    // Whitespace: prefer ending on the last newline of the run, then leave one
    // space for the following word.
    const std::size_t run_end = skip_while(start, is_space);
    std::size_t last_newline_end = 0;
    std::size_t last_cp_start = start;
    for (std::size_t pos = start; pos < run_end;) {
      const auto cp = at(pos);
      if (is_newline(cp.value)) {
        last_newline_end = pos + cp.length;
      }
      last_cp_start = pos;
      pos += cp.length;
    }
    if (last_newline_end > 0) {
      return last_newline_end;
    }
    if (run_end >= text_.size() || last_cp_start == start) {
      return run_end;
    }
    return last_cp_start;
  }

  std::string_view text_;
  std::size_t pos_ = 0;
};

std::string sanitize_utf8(const std::string &bytes) {
  std::string out;
  out.reserve(bytes.size());
  std::size_t pos = 0;
  while (pos < bytes.size()) {
    const std::size_t length = utf8_sequence_length(bytes, pos);
    if (length == 0) {
      out += kReplacementUtf8;
      ++pos;
      continue;
    }
    out.append(bytes, pos, length);
    pos += length;
  }
  return out;
}

} // namespace

std::vector<std::string_view> pretokenize(const std::string_view text) {
  std::vector<std::string_view> pieces;
  PieceScanner scanner(text);
  while (!scanner.done()) {
    pieces.push_back(scanner.next());
  }
  return pieces;
}

BpeTokenizer::BpeTokenizer(std::string name, RankMap ranks)
    : name_(std::move(name)), ranks_(std::move(ranks)) {
  Token max_rank = 0;
  for (const auto &[bytes, rank] : ranks_) {
    max_rank = std::max(max_rank, rank);
  }
  decoder_.resize(static_cast<std::size_t>(max_rank) + 1);
  for (const auto &[bytes, rank] : ranks_) {
    decoder_[rank] = bytes;
  }
}

common::Result<std::shared_ptr<const BpeTokenizer>> BpeTokenizer::create(std::string name,
                                                                          RankMap ranks) {
  using ResultT = common::Result<std::shared_ptr<const BpeTokenizer>>;
  for (int byte = 0; byte < 256; ++byte) {
    if (!ranks.contains(std::string(1, static_cast<char>(byte)))) {
      return ResultT::failure("vocabulary is missing single byte " + std::to_string(byte));
    }
  }

  std::vector<bool> seen;
  for (const auto &[bytes, rank] : ranks) {
    if (bytes.empty()) {
      return ResultT::failure("vocabulary contains an empty token");
    }
    if (rank >= seen.size()) {
      seen.resize(static_cast<std::size_t>(rank) + 1, false);
    }
    if (seen[rank]) {
      return ResultT::failure("duplicate rank " + std::to_string(rank));
    }
    seen[rank] = true;
  }

  return ResultT::success(
      std::shared_ptr<const BpeTokenizer>(new BpeTokenizer(std::move(name), std::move(ranks))));
}

common::Result<std::shared_ptr<const BpeTokenizer>>
BpeTokenizer::from_tiktoken(const std::string_view content, std::string name) {
  using ResultT = common::Result<std::shared_ptr<const BpeTokenizer>>;
  RankMap ranks;
  std::istringstream stream{std::string(content)};
  std::string line;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = common::trim(line);
    if (clean.empty()) {
      continue;
    }

    const auto space = clean.find(' ');
    if (space == std::string::npos) {
      return ResultT::failure("malformed vocabulary line " + std::to_string(line_number));
    }

    auto bytes = common::base64_decode(clean.substr(0, space));
    if (!bytes.ok()) {
      return ResultT::failure("line " + std::to_string(line_number) + ": " + bytes.error());
    }
    const auto rank = common::parse_int(clean.substr(space + 1));
    if (!rank.has_value() || *rank < 0) {
      return ResultT::failure("invalid rank on line " + std::to_string(line_number));
    }
    ranks[bytes.value()] = static_cast<Token>(*rank);
  }

  return create(std::move(name), std::move(ranks));
}

common::Result<std::shared_ptr<const BpeTokenizer>>
BpeTokenizer::from_tiktoken_file(const std::filesystem::path &path) {
  auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<std::shared_ptr<const BpeTokenizer>>::failure(content.error());
  }
  return from_tiktoken(content.value(), path.stem().string());
}

std::shared_ptr<const BpeTokenizer> BpeTokenizer::builtin() {
  RankMap ranks;
  Token next = 0;
  for (int byte = 0; byte < 256; ++byte) {
    ranks.emplace(std::string(1, static_cast<char>(byte)), next++);
  }
  for (char first = ' '; first <= '~'; ++first) {
    for (char second = ' '; second <= '~'; ++second) {
      ranks.emplace(std::string{first, second}, next++);
    }
  }
  return std::shared_ptr<const BpeTokenizer>(new BpeTokenizer("builtin", std::move(ranks)));
}

std::optional<Token> BpeTokenizer::rank_of(const std::string_view bytes) const {
  const auto it = ranks_.find(std::string(bytes));
  if (it == ranks_.end()) {
    return std::nullopt;
  }
  return it->second;
}

void BpeTokenizer::encode_piece(const std::string_view piece, std::vector<Token> &out) const {
  if (const auto whole = rank_of(piece); whole.has_value()) {
    out.push_back(*whole);
    return;
  }

  // Boundaries between current parts; repeatedly fuse the adjacent pair with
  // the lowest rank (leftmost on ties) until no fused pair is in the vocabulary.
  std::vector<std::size_t> bounds(piece.size() + 1);
  for (std::size_t i = 0; i <= piece.size(); ++i) {
    bounds[i] = i;
  }

  while (bounds.size() > 2) {
    std::optional<Token> best_rank;
    std::size_t best_index = 0;
    for (std::size_t i = 0; i + 2 < bounds.size(); ++i) {
      const auto rank = rank_of(piece.substr(bounds[i], bounds[i + 2] - bounds[i]));
      if (rank.has_value() && (!best_rank.has_value() || *rank < *best_rank)) {
        best_rank = rank;
        best_index = i;
      }
    }
    if (!best_rank.has_value()) {
      break;
    }
    bounds.erase(bounds.begin() + static_cast<std::ptrdiff_t>(best_index) + 1);
  }

  for (std::size_t i = 0; i + 1 < bounds.size(); ++i) {
    out.push_back(ranks_.at(std::string(piece.substr(bounds[i], bounds[i + 1] - bounds[i]))));
  }
}

std::vector<Token> BpeTokenizer::encode(const std::string_view text) const {
  std::vector<Token> tokens;
  tokens.reserve(text.size() / 2 + 1);
  for (const auto piece : pretokenize(text)) {
    encode_piece(piece, tokens);
  }
  return tokens;
}

std::string BpeTokenizer::decode_bytes(const std::span<const Token> tokens) const {
  std::string bytes;
  for (const Token token : tokens) {
    if (token >= decoder_.size() || !decoder_[token].has_value()) {
      throw std::out_of_range("unknown token id " + std::to_string(token));
    }
    bytes += *decoder_[token];
  }
  return bytes;
}

std::string BpeTokenizer::decode(const std::span<const Token> tokens) const {
  return sanitize_utf8(decode_bytes(tokens));
}

} // namespace hwcc::chunk

#pragma once

#include "hwcc/chunk/tokenizer.hpp"

#include <array>
#include <string>
#include <string_view>
#include <vector>

namespace hwcc::chunk {

enum class SeparatorKind {
  Heading1,
  Heading2,
  Heading3Plus,
  Literal,
};

struct Separator {
  SeparatorKind kind = SeparatorKind::Literal;
  std::string_view literal;
};

// Priority order: H1, H2, H3+, paragraph break, line break, space.
[[nodiscard]] const std::array<Separator, 6> &default_separators();

// Splits non-atomic text into pieces of at most max_tokens tokens, preferring
// structural boundaries and falling back to a hard split on token windows.
class RecursiveSplitter {
public:
  explicit RecursiveSplitter(const ITokenizer &tokenizer);

  [[nodiscard]] std::vector<std::string> split(const std::string &text, int max_tokens) const;

  // Pieces of text cut on one separator, before empty parts are dropped.
  [[nodiscard]] static std::vector<std::string> split_on(const std::string &text,
                                                         const Separator &separator);

private:
  void split_from(const std::string &text, int max_tokens, std::size_t separator_index,
                  std::vector<std::string> &out) const;
  void hard_split(const std::string &text, int max_tokens, std::vector<std::string> &out) const;

  const ITokenizer &tokenizer_;
};

} // namespace hwcc::chunk

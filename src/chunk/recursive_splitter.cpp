#include "hwcc/chunk/recursive_splitter.hpp"

#include "hwcc/common/fs.hpp"

#include <algorithm>
#include <stdexcept>

namespace hwcc::chunk {

namespace {

bool is_blank(const std::string &text) { return common::trim(text).empty(); }

// True when a heading of the separator's tier starts at pos.
bool heading_starts_at(const std::string &text, const std::size_t pos, const SeparatorKind kind) {
  std::size_t hashes = 0;
  while (pos + hashes < text.size() && text[pos + hashes] == '#') {
    ++hashes;
  }
  if (pos + hashes >= text.size() || text[pos + hashes] != ' ') {
    return false;
  }
  switch (kind) {
  case SeparatorKind::Heading1:
    return hashes == 1;
  case SeparatorKind::Heading2:
    return hashes == 2;
  case SeparatorKind::Heading3Plus:
    return hashes >= 3;
  case SeparatorKind::Literal:
    return false;
  }
  return false;
}

// Cuts before each heading of the tier. The cut sits ahead of the newline
// that precedes the heading, so the newline travels with the heading.
std::vector<std::string> split_before_headings(const std::string &text, const SeparatorKind kind) {
  std::vector<std::string> parts;
  std::size_t part_start = 0;
  for (std::size_t pos = 0; pos < text.size(); ++pos) {
    const bool cut = (pos == 0 && heading_starts_at(text, 0, kind)) ||
                     (text[pos] == '\n' && heading_starts_at(text, pos + 1, kind));
    if (!cut) {
      continue;
    }
    parts.push_back(text.substr(part_start, pos - part_start));
    part_start = pos;
  }
  parts.push_back(text.substr(part_start));
  return parts;
}

std::vector<std::string> split_literal(const std::string &text, const std::string_view separator) {
  std::vector<std::string> parts;
  std::size_t start = 0;
  while (true) {
    const auto found = text.find(separator, start);
    if (found == std::string::npos) {
      parts.push_back(text.substr(start));
      break;
    }
    parts.push_back(text.substr(start, found - start));
    start = found + separator.size();
  }
  return parts;
}

} // namespace

const std::array<Separator, 6> &default_separators() {
  static const std::array<Separator, 6> separators = {{
      {SeparatorKind::Heading1, "\n# "},
      {SeparatorKind::Heading2, "\n## "},
      {SeparatorKind::Heading3Plus, "\n### "},
      {SeparatorKind::Literal, "\n\n"},
      {SeparatorKind::Literal, "\n"},
      {SeparatorKind::Literal, " "},
  }};
  return separators;
}

RecursiveSplitter::RecursiveSplitter(const ITokenizer &tokenizer) : tokenizer_(tokenizer) {}

std::vector<std::string> RecursiveSplitter::split(const std::string &text,
                                                  const int max_tokens) const {
  if (max_tokens < 1) {
    throw std::invalid_argument("max_tokens must be >= 1");
  }
  std::vector<std::string> out;
  split_from(text, max_tokens, 0, out);
  return out;
}

std::vector<std::string> RecursiveSplitter::split_on(const std::string &text,
                                                     const Separator &separator) {
  if (separator.kind == SeparatorKind::Literal) {
    return split_literal(text, separator.literal);
  }
  return split_before_headings(text, separator.kind);
}

void RecursiveSplitter::split_from(const std::string &text, const int max_tokens,
                                   std::size_t separator_index,
                                   std::vector<std::string> &out) const {
  const auto &separators = default_separators();

  if (tokenizer_.count(text) <= max_tokens) {
    out.push_back(text);
    return;
  }

  // Walk down the separator list until one actually divides the text.
  std::vector<std::string> parts;
  while (separator_index < separators.size()) {
    parts = split_on(text, separators[separator_index]);
    parts.erase(std::remove_if(parts.begin(), parts.end(), is_blank), parts.end());
    if (parts.size() > 1) {
      break;
    }
    ++separator_index;
  }
  if (separator_index >= separators.size()) {
    hard_split(text, max_tokens, out);
    return;
  }

  const Separator &separator = separators[separator_index];
  const std::string rejoin =
      separator.kind == SeparatorKind::Literal ? std::string(separator.literal) : "\n";

  std::string current;
  for (const auto &part : parts) {
    const std::string candidate = current.empty() ? part : current + rejoin + part;
    if (tokenizer_.count(candidate) <= max_tokens) {
      current = candidate;
      continue;
    }

    if (!current.empty()) {
      out.push_back(current);
    }
    if (tokenizer_.count(part) > max_tokens) {
      split_from(part, max_tokens, separator_index + 1, out);
      current.clear();
    } else {
      current = part;
    }
  }

  if (!current.empty()) {
    out.push_back(current);
  }
}

void RecursiveSplitter::hard_split(const std::string &text, const int max_tokens,
                                   std::vector<std::string> &out) const {
  const auto tokens = tokenizer_.encode(text);
  const std::span<const Token> all(tokens);
  const auto window = static_cast<std::size_t>(max_tokens);
  std::size_t start = 0;
  while (start < tokens.size()) {
    const std::size_t limit = std::min(start + window, tokens.size());
    // Windows end on code points; the bytes of a cut character move to the
    // next window.
    std::size_t end = code_point_end(tokenizer_, all, start, limit);
    if (end == 0) {
      // A single character needs more tokens than the budget allows; keep it whole.
      end = limit;
      while (end < tokens.size() && code_point_end(tokenizer_, all, start, end) != end) {
        ++end;
      }
    }
    out.push_back(tokenizer_.decode(all.subspan(start, end - start)));
    start = end;
  }
}

} // namespace hwcc::chunk

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace hwcc::chunk {

// Line-level recognizers for the normalized markup dialect produced by the
// format parsers: ATX headings, fenced blocks, pipe tables and page markers.

struct FenceMarker {
  char ch = '`';
  std::size_t length = 0;
};

struct Heading {
  int level = 0;
  std::string title;
};

// A line opening with 3+ backticks or 3+ tildes (info string allowed).
[[nodiscard]] std::optional<FenceMarker> match_fence_open(std::string_view line);
// A line made only of the opening character, at least as many times.
[[nodiscard]] bool is_fence_close(std::string_view line, const FenceMarker &open);

// "|...|" with at least one character between the pipes.
[[nodiscard]] bool is_table_row(std::string_view line);
// "|", optional spaces/colons, dashes, optional spaces/colons, "|".
[[nodiscard]] bool is_table_separator(std::string_view line);

// "#" x1-6, whitespace, title text. The title is trimmed.
[[nodiscard]] std::optional<Heading> match_heading(std::string_view line);

[[nodiscard]] bool contains_fence(std::string_view text);
[[nodiscard]] bool contains_table_separator(std::string_view text);
[[nodiscard]] bool contains_heading(std::string_view text);

// Page markers look like "<!-- PAGE:12 -->".
[[nodiscard]] std::optional<std::int64_t> first_page_marker(std::string_view text);
// Removes every marker together with one newline directly after it.
[[nodiscard]] std::string strip_page_markers(std::string_view text);

} // namespace hwcc::chunk

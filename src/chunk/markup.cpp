#include "hwcc/chunk/markup.hpp"

#include "hwcc/common/fs.hpp"
#include "hwcc/common/toml.hpp"

#include <cctype>
#include <iterator>
#include <regex>

namespace hwcc::chunk {

namespace {

bool is_space_char(const char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

template <typename Predicate> bool any_line(const std::string_view text, Predicate predicate) {
  std::size_t start = 0;
  while (start <= text.size()) {
    auto end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    if (predicate(text.substr(start, end - start))) {
      return true;
    }
    start = end + 1;
  }
  return false;
}

const std::regex &page_marker_pattern() {
  static const std::regex pattern(R"(<!-- PAGE:(\d+) -->)");
  return pattern;
}

} // namespace

std::optional<FenceMarker> match_fence_open(const std::string_view line) {
  if (line.empty() || (line.front() != '`' && line.front() != '~')) {
    return std::nullopt;
  }
  const char ch = line.front();
  std::size_t length = 0;
  while (length < line.size() && line[length] == ch) {
    ++length;
  }
  if (length < 3) {
    return std::nullopt;
  }
  return FenceMarker{.ch = ch, .length = length};
}

bool is_fence_close(const std::string_view line, const FenceMarker &open) {
  if (line.size() < open.length) {
    return false;
  }
  for (const char ch : line) {
    if (ch != open.ch) {
      return false;
    }
  }
  return true;
}

bool is_table_row(const std::string_view line) {
  return line.size() >= 3 && line.front() == '|' && line.back() == '|';
}

bool is_table_separator(const std::string_view line) {
  if (line.empty() || line.front() != '|') {
    return false;
  }
  std::size_t pos = 1;
  const auto skip_padding = [&] {
    while (pos < line.size() && (is_space_char(line[pos]) || line[pos] == ':')) {
      ++pos;
    }
  };
  skip_padding();
  const std::size_t dashes_start = pos;
  while (pos < line.size() && line[pos] == '-') {
    ++pos;
  }
  if (pos == dashes_start) {
    return false;
  }
  skip_padding();
  return pos < line.size() && line[pos] == '|';
}

std::optional<Heading> match_heading(const std::string_view line) {
  std::size_t level = 0;
  while (level < line.size() && line[level] == '#') {
    ++level;
  }
  if (level == 0 || level > 6) {
    return std::nullopt;
  }
  // Needs at least one whitespace character and one more character after it.
  if (level + 1 >= line.size() || !is_space_char(line[level])) {
    return std::nullopt;
  }
  return Heading{.level = static_cast<int>(level), .title = common::trim(line.substr(level + 1))};
}

bool contains_fence(const std::string_view text) {
  return any_line(text, [](std::string_view line) { return match_fence_open(line).has_value(); });
}

bool contains_table_separator(const std::string_view text) {
  return any_line(text, [](std::string_view line) { return is_table_separator(line); });
}

bool contains_heading(const std::string_view text) {
  return any_line(text, [](std::string_view line) { return match_heading(line).has_value(); });
}

std::optional<std::int64_t> first_page_marker(const std::string_view text) {
  std::match_results<std::string_view::const_iterator> match;
  if (!std::regex_search(text.begin(), text.end(), match, page_marker_pattern())) {
    return std::nullopt;
  }
  return common::parse_int64(match[1].str());
}

std::string strip_page_markers(const std::string_view text) {
  static const std::regex strip_pattern(R"(<!-- PAGE:\d+ -->\n?)");
  std::string out;
  std::regex_replace(std::back_inserter(out), text.begin(), text.end(), strip_pattern, "");
  return out;
}

} // namespace hwcc::chunk

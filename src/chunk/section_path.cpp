#include "hwcc/chunk/section_path.hpp"

#include "hwcc/chunk/markup.hpp"
#include "hwcc/common/fs.hpp"

namespace hwcc::chunk {

// Only ATX headings move the stack; bold runs are never promoted to sub-headings.
void SectionPathTracker::update(const std::string_view text) {
  for (const auto &line : common::split_lines(text)) {
    auto heading = match_heading(line);
    if (!heading.has_value()) {
      continue;
    }
    while (!stack_.empty() && stack_.back().first >= heading->level) {
      stack_.pop_back();
    }
    stack_.emplace_back(heading->level, std::move(heading->title));
  }
}

std::string SectionPathTracker::path() const {
  std::string out;
  for (std::size_t i = 0; i < stack_.size(); ++i) {
    if (i > 0) {
      out += " > ";
    }
    out += stack_[i].second;
  }
  return out;
}

} // namespace hwcc::chunk

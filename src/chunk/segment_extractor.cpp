#include "hwcc/chunk/segment_extractor.hpp"

#include "hwcc/chunk/markup.hpp"
#include "hwcc/common/fs.hpp"

#include <algorithm>

namespace hwcc::chunk {

namespace {

class SegmentBuilder {
public:
  void add_text_line(const std::string &line) { pending_.push_back(line); }

  void add_text_lines(const std::vector<std::string> &lines) {
    pending_.insert(pending_.end(), lines.begin(), lines.end());
  }

  void add_atomic(const std::vector<std::string> &lines) {
    flush();
    segments_.push_back(Segment{.text = common::join_lines(lines), .is_atomic = true});
  }

  void flush() {
    if (pending_.empty()) {
      return;
    }
    segments_.push_back(Segment{.text = common::join_lines(pending_), .is_atomic = false});
    pending_.clear();
  }

  std::vector<Segment> finish() {
    flush();
    return std::move(segments_);
  }

private:
  std::vector<std::string> pending_;
  std::vector<Segment> segments_;
};

} // namespace

std::vector<Segment> extract_segments(const std::string_view text) {
  const auto lines = common::split_lines(text);
  SegmentBuilder builder;

  std::size_t i = 0;
  while (i < lines.size()) {
    const std::string &line = lines[i];

    if (const auto fence = match_fence_open(line); fence.has_value()) {
      // An unterminated fence runs to the end of the document.
      std::vector<std::string> block{line};
      ++i;
      while (i < lines.size()) {
        block.push_back(lines[i]);
        const bool closed = is_fence_close(lines[i], *fence);
        ++i;
        if (closed) {
          break;
        }
      }
      builder.add_atomic(block);
      continue;
    }

    if (is_table_row(line)) {
      std::vector<std::string> rows;
      while (i < lines.size() && is_table_row(lines[i])) {
        rows.push_back(lines[i]);
        ++i;
      }
      const bool has_separator =
          std::any_of(rows.begin(), rows.end(), [](const std::string &row) {
            return is_table_separator(row);
          });
      if (has_separator) {
        builder.add_atomic(rows);
      } else {
        builder.add_text_lines(rows);
      }
      continue;
    }

    builder.add_text_line(line);
    ++i;
  }

  return builder.finish();
}

} // namespace hwcc::chunk

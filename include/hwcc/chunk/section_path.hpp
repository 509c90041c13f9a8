#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace hwcc::chunk {

// Heading stack for one document. Levels strictly increase from bottom to
// top. Owned by a single chunk() call and fed each finished chunk in order.
class SectionPathTracker {
public:
  void update(std::string_view text);

  // Titles from outermost to innermost, joined with " > ".
  [[nodiscard]] std::string path() const;
  [[nodiscard]] std::size_t depth() const { return stack_.size(); }

private:
  std::vector<std::pair<int, std::string>> stack_;
};

} // namespace hwcc::chunk

#pragma once

#include "hwcc/chunk/types.hpp"

#include <functional>
#include <string_view>
#include <vector>

namespace hwcc::chunk {

// Assigns a ContentType via an ordered rule cascade; the first matching rule
// wins. Rules are fixed at construction and classify() is a pure function of
// the text, so one instance can be shared between threads.
class ContentTypeClassifier {
public:
  ContentTypeClassifier();

  [[nodiscard]] ContentType classify(std::string_view text) const;
  [[nodiscard]] std::string classify_label(std::string_view text) const;

private:
  struct Rule {
    std::function<bool(std::string_view)> matches;
    ContentType type;
  };

  // Refines text that contains a table separator row.
  std::vector<Rule> table_rules_;
  // Keyword families for everything else, then the heading fallback.
  std::vector<Rule> prose_rules_;
};

} // namespace hwcc::chunk

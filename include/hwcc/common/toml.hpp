#pragma once

#include "hwcc/common/result.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace hwcc::common {

// Flat view of a TOML file: "section.key" -> raw value text.
struct TomlDocument {
  std::unordered_map<std::string, std::string> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] int get_int(const std::string &key, int fallback) const;
};

[[nodiscard]] Result<TomlDocument> parse_toml(const std::string &content);
[[nodiscard]] std::optional<int> parse_int(std::string_view text);
[[nodiscard]] std::optional<std::int64_t> parse_int64(std::string_view text);

} // namespace hwcc::common

#pragma once

#include "hwcc/common/result.hpp"
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace hwcc::common {

[[nodiscard]] std::string trim(std::string_view input);
[[nodiscard]] bool starts_with(std::string_view value, std::string_view prefix);
[[nodiscard]] std::string to_lower(std::string value);

// Splits on '\n' only. A trailing newline yields a trailing empty line, so
// join_lines(split_lines(text)) == text.
[[nodiscard]] std::vector<std::string> split_lines(std::string_view text);
[[nodiscard]] std::string join_lines(const std::vector<std::string> &lines);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] std::string expand_path(std::string value);
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

} // namespace hwcc::common

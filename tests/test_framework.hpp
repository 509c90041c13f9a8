#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace hwcc::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

inline void require_contains(std::string_view text, std::string_view needle,
                             const std::string &message) {
  if (text.find(needle) == std::string_view::npos) {
    throw std::runtime_error(message + " (missing \"" + std::string(needle) + "\")");
  }
}

// Runs fn and returns what() of the expected exception. Other exception
// types propagate and fail the test with their own message.
template <typename Exception, typename Fn>
std::string require_throws(Fn &&fn, const std::string &message) {
  try {
    fn();
  } catch (const Exception &ex) {
    return ex.what();
  }
  throw std::runtime_error(message);
}

} // namespace hwcc::tests

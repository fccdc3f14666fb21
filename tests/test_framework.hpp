#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace playwarden::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Tool results are long; the failure message carries the whole text.
inline void require_contains(const std::string &text, const std::string &needle,
                             const std::string &message) {
  if (text.find(needle) == std::string::npos) {
    throw std::runtime_error(message + "\n  expected to find: " + needle + "\n  in: " + text);
  }
}

} // namespace playwarden::tests

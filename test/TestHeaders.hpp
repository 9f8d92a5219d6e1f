#ifndef __TETHER_TEST_HEADERS__
#define __TETHER_TEST_HEADERS__

#include "Headers.hpp"

#include "catch2/catch.hpp"

namespace tether {
/** @brief Polls cond every few milliseconds until it holds or time runs out. */
template <typename F>
inline bool waitUntil(F cond, int64_t timeoutMs = 5000) {
  auto start = Clock::now();
  while (!cond()) {
    if (millisSince(start) > timeoutMs) {
      return false;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

/** @brief Temporary directory removed when the object goes away. */
class TempDir {
 public:
  TempDir() {
    string pattern = GetTempDirectory() + string("tether_test_XXXXXXXX");
    path = string(mkdtemp(&pattern[0]));
  }
  ~TempDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  string path;
};
}  // namespace tether

#endif  // __TETHER_TEST_HEADERS__

#include "WaitingStateDetector.hpp"

#include "TestHeaders.hpp"

using namespace tether;

namespace {
const auto t0 = Clock::now();

Clock::time_point at(int64_t ms) {
  return t0 + std::chrono::milliseconds(ms);
}
}  // namespace

TEST_CASE("Bell makes the process wait exactly once", "[WaitingStateDetector]") {
  WaitingStateDetector detector(200, 1500);

  REQUIRE(!detector.onOutput("working...", at(0)));
  auto changed = detector.onOutput("question?\x07", at(10));
  REQUIRE(changed);
  REQUIRE(*changed == true);
  REQUIRE(detector.isWaiting());

  // A second bell while already waiting emits nothing
  REQUIRE(!detector.onOutput("\x07", at(20)));
  REQUIRE(detector.isWaiting());
}

TEST_CASE("Waiting clears after enough output and grace",
          "[WaitingStateDetector]") {
  WaitingStateDetector detector(200, 1500);
  REQUIRE(detector.onOutput("\x07", at(0)));

  SECTION("Redraws inside the grace window do not clear") {
    REQUIRE(!detector.onOutput(string(500, 'r'), at(100)));
    REQUIRE(detector.isWaiting());
    auto changed = detector.onOutput("x", at(1600));
    REQUIRE(changed);
    REQUIRE(*changed == false);
  }

  SECTION("Too little output does not clear") {
    REQUIRE(!detector.onOutput(string(150, 'a'), at(2000)));
    REQUIRE(detector.isWaiting());
    auto changed = detector.onOutput(string(60, 'b'), at(2100));
    REQUIRE(changed);
    REQUIRE(*changed == false);
    REQUIRE(!detector.isWaiting());
  }

  SECTION("Escape sequences do not count") {
    string colors;
    for (int a = 0; a < 100; a++) {
      colors += "\x1b[0m";
    }
    REQUIRE(!detector.onOutput(colors, at(2000)));
    REQUIRE(detector.isWaiting());
  }
}

TEST_CASE("Seeded waiting state honors suppression", "[WaitingStateDetector]") {
  WaitingStateDetector detector(200, 1500);
  detector.seed(true, at(0));
  detector.suppressClearUntil(at(5000));

  REQUIRE(!detector.onOutput(string(1000, 'x'), at(100)));
  REQUIRE(detector.isWaiting());
  auto changed = detector.onOutput("y", at(5001));
  REQUIRE(changed);
  REQUIRE(*changed == false);
}

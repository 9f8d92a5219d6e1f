#ifndef __TETHER_WAITING_STATE_DETECTOR__
#define __TETHER_WAITING_STATE_DETECTOR__

#include "Headers.hpp"
#include "OutputHeuristics.hpp"

namespace tether {
/**
 * @brief Infers whether a process is blocked on interactive input.
 *
 * A bell flips the detector to waiting. It flips back only once enough
 * visible output arrived after the bell and the grace window has passed,
 * so redraws right after the bell do not clear it.
 */
class WaitingStateDetector {
 public:
  WaitingStateDetector(int64_t _clearVisibleBytes, int64_t _graceMs);

  /**
   * @brief Feeds freshly arrived output.
   * @return The new waiting state when it changed, otherwise nothing.
   */
  optional<bool> onOutput(const string& chunk, Clock::time_point now);

  /**
   * @brief Forces the waiting flag, e.g. from a text heuristic after
   * reattaching. Emits nothing.
   */
  void seed(bool _waiting, Clock::time_point now);

  /** @brief Holds off any clear until the given time. */
  void suppressClearUntil(Clock::time_point until);

  bool isWaiting() const { return waiting; }
  int64_t getBytesSinceBell() const { return bytesSinceBell; }

 protected:
  AnsiScanner scanner;
  int64_t clearVisibleBytes;
  std::chrono::milliseconds grace;
  bool waiting;
  int64_t bytesSinceBell;
  Clock::time_point bellClearAfter;
  Clock::time_point suppressedUntil;
};
}  // namespace tether

#endif  // __TETHER_WAITING_STATE_DETECTOR__

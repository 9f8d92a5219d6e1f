#include "WaitingStateDetector.hpp"

namespace tether {
WaitingStateDetector::WaitingStateDetector(int64_t _clearVisibleBytes,
                                           int64_t _graceMs)
    : clearVisibleBytes(_clearVisibleBytes),
      grace(_graceMs),
      waiting(false),
      bytesSinceBell(0) {}

optional<bool> WaitingStateDetector::onOutput(const string& chunk,
                                              Clock::time_point now) {
  ScanResult scan = scanner.scan(chunk);
  if (scan.sawBell) {
    bytesSinceBell = scan.visibleBytesAfterBell;
    bellClearAfter = now + grace;
    if (!waiting) {
      waiting = true;
      VLOG(1) << "Bell seen, process is waiting for input";
      return true;
    }
    return nullopt;
  }

  if (!waiting) {
    return nullopt;
  }
  bytesSinceBell += scan.visibleBytes;
  if (bytesSinceBell >= clearVisibleBytes && now >= bellClearAfter &&
      now >= suppressedUntil) {
    waiting = false;
    bytesSinceBell = 0;
    VLOG(1) << "Output resumed, process is no longer waiting";
    return false;
  }
  return nullopt;
}

void WaitingStateDetector::seed(bool _waiting, Clock::time_point now) {
  waiting = _waiting;
  bytesSinceBell = 0;
  bellClearAfter = now;
}

void WaitingStateDetector::suppressClearUntil(Clock::time_point until) {
  suppressedUntil = until;
}
}  // namespace tether

#ifndef __TETHER_SUPERVISOR_CONFIG__
#define __TETHER_SUPERVISOR_CONFIG__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Tunables of the supervisor. Every heuristic threshold lives here so
 * none of them is load-bearing in code.
 */
struct SupervisorConfig {
  // Bytes of output kept in memory and persisted as the tail
  int64_t maxOutputLog = 500 * 1024;
  int64_t flushIntervalMs = 10000;
  int64_t healthCheckDelayMs = 20000;
  int64_t healthVisibleThreshold = 100;
  int64_t waitingClearVisibleBytes = 200;
  int64_t waitingGraceMs = 1500;
  int64_t recoveryGraceMs = 5000;
  int64_t ledgerMaxEntries = 1000;
  int64_t ledgerTtlMs = 5 * 60 * 1000;
  int64_t viewerBufferBytes = 4 * 1024 * 1024;
  int64_t subprocessTimeoutMs = 5000;
  int64_t promptSendTimeoutMs = 5000;
  int64_t promptSettleMs = 300;
  string agentBinary = "claude";
  string shell;
  int defaultCols = 120;
  int defaultRows = 40;
  string tmuxSocket = "tether";
  string tmuxPrefix = "tw-";
  string tmuxConfig;

  SupervisorConfig();

  /**
   * @brief Overrides defaults with the values present in an INI file.
   * @throws std::runtime_error when the file cannot be parsed.
   */
  void loadFromIni(const string& path);
};
}  // namespace tether

#endif  // __TETHER_SUPERVISOR_CONFIG__

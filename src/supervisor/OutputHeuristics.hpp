#ifndef __TETHER_OUTPUT_HEURISTICS__
#define __TETHER_OUTPUT_HEURISTICS__

#include "Headers.hpp"

namespace tether {
const char BELL = '\x07';

/** @brief Result of scanning one chunk of terminal output. */
struct ScanResult {
  bool sawBell = false;
  // Printable bytes outside of control and escape sequences
  int64_t visibleBytes = 0;
  // Printable bytes after the last bell in the chunk
  int64_t visibleBytesAfterBell = 0;
};

/**
 * @brief Incremental scanner for raw terminal output.
 *
 * Keeps its escape-sequence state between chunks, so a sequence split across
 * two reads is still recognized. A BEL that terminates an OSC string is not
 * counted as a bell.
 */
class AnsiScanner {
 public:
  AnsiScanner() : state(State::NORMAL) {}

  ScanResult scan(const string& chunk);

 protected:
  enum class State { NORMAL, ESCAPE, CSI, STRING, STRING_ESCAPE };
  State state;
};

/** @brief Counts printable bytes, ignoring control and escape sequences. */
int64_t countVisibleBytes(const string& output);

/** @brief Removes control and escape sequences, keeping newlines. */
string stripAnsi(const string& output);

/**
 * @brief Scans the last lines of a screen capture for interactive
 * confirmation phrasing (yes/no prompts, permission questions).
 */
bool looksLikeInteractivePrompt(const string& screen);

/**
 * @brief Judges whether a freshly spawned process produced credible output:
 * enough visible bytes or recognizable startup/prompt text.
 */
bool isStartupHealthy(const string& output, int64_t visibleThreshold);

/**
 * @brief Whether an interactive agent looks ready to have its first prompt
 * typed in.
 */
bool looksReadyForPrompt(const string& output);
}  // namespace tether

#endif  // __TETHER_OUTPUT_HEURISTICS__

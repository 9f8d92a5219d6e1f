#ifndef __TETHER_SUBPROCESS_UTILS__
#define __TETHER_SUBPROCESS_UTILS__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Thrown when a helper command does not finish inside its time limit.
 *
 * The child is killed before this is thrown.
 */
class SubprocessTimeout : public std::runtime_error {
 public:
  explicit SubprocessTimeout(const string& command)
      : std::runtime_error("Timed out waiting for " + command) {}
};

/** @brief Exit status and captured stdout of a finished command. */
struct SubprocessResult {
  int exitCode;
  string output;

  bool ok() const { return exitCode == 0; }
};

/**
 * @brief Utility class for executing subprocesses and capturing output.
 */
class SubprocessUtils {
 public:
  virtual ~SubprocessUtils() = default;

  /**
   * @brief Runs a command with arguments while capturing its stdout without a
   * shell.
   *
   * stderr is discarded. A command that cannot be executed reports exit code
   * 127.
   *
   * @throws SubprocessTimeout when the command runs longer than timeoutMs.
   */
  virtual SubprocessResult run(const string& command,
                               const vector<string>& args, int64_t timeoutMs);
};
}  // namespace tether

#endif  // __TETHER_SUBPROCESS_UTILS__

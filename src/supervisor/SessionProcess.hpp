#ifndef __TETHER_SESSION_PROCESS__
#define __TETHER_SESSION_PROCESS__

#include "Headers.hpp"

namespace tether {
/** @brief Executable, arguments and terminal geometry of a process. */
struct LaunchSpec {
  string command;
  vector<string> args;
  string cwd;
  int cols = 120;
  int rows = 40;
  map<string, string> environment;
};

/**
 * @brief Abstract interactive process observed through a single fd.
 */
class SessionProcess {
 public:
  virtual ~SessionProcess() {}

  /**
   * @brief Starts the process.
   * @throws std::runtime_error when it could not be created.
   */
  virtual void start(const LaunchSpec& launch) = 0;
  /** @brief Returns the descriptor that can be polled for terminal output. */
  virtual int getFd() = 0;
  virtual pid_t getPid() = 0;
  /** @brief Writes keystrokes to the process. Errors after exit are ignored. */
  virtual void write(const string& data) = 0;
  virtual void resize(int cols, int rows) = 0;
  /** @brief Asks the process to end. Does not wait. */
  virtual void terminate() = 0;
  /**
   * @brief Reaps the process, escalating to SIGKILL if it lingers after
   * terminate().
   * @return The exit code, or 128 + signal when it was killed by a signal.
   */
  virtual int waitForExit() = 0;
  /** @brief Releases the fd and any login records. */
  virtual void cleanup() = 0;
};

/** @brief Creates processes so tests can swap in fakes. */
class ProcessFactory {
 public:
  virtual ~ProcessFactory() {}
  virtual shared_ptr<SessionProcess> create() = 0;
};
}  // namespace tether

#endif  // __TETHER_SESSION_PROCESS__

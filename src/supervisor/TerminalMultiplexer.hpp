#ifndef __TETHER_TERMINAL_MULTIPLEXER__
#define __TETHER_TERMINAL_MULTIPLEXER__

#include "Headers.hpp"
#include "SessionProcess.hpp"

namespace tether {
/**
 * @brief A detachable terminal multiplexer that keeps processes alive
 * independently of the supervisor.
 *
 * All operations are keyed by session id. Calls that talk to the
 * multiplexer may throw SubprocessTimeout.
 */
class TerminalMultiplexer {
 public:
  virtual ~TerminalMultiplexer() {}

  /** @brief Whether the multiplexer can be used on this host. */
  virtual bool isAvailable() = 0;
  /** @brief Name of the multiplexed session backing a session id. */
  virtual string nameFor(const string& sessionId) = 0;
  /**
   * @brief Creates a detached session running the given command.
   * @throws std::runtime_error when the session could not be created.
   */
  virtual void createSession(const string& sessionId,
                             const LaunchSpec& launch) = 0;
  /**
   * @brief Returns the command that attaches a client to an existing session.
   */
  virtual LaunchSpec attachCommand(const string& sessionId, int cols,
                                   int rows) = 0;
  virtual bool hasSession(const string& sessionId) = 0;
  /** @return true when a session was actually killed. */
  virtual bool killSession(const string& sessionId) = 0;
  /**
   * @brief Captures the pane including its scrollback, or nothing when the
   * capture failed.
   */
  virtual optional<string> capturePane(const string& sessionId) = 0;
  /** @brief Session ids of all live sessions we own. */
  virtual vector<string> listSessions() = 0;
  /** @brief Detaches every client so the session survives on its own. */
  virtual void detachClients(const string& sessionId) = 0;
  /**
   * @brief Called once the session's command has ended. Removes the files
   * kept for the session.
   * @return The exit code of the command, when it recorded one.
   */
  virtual optional<int> reapSession(const string& sessionId) = 0;
};
}  // namespace tether

#endif  // __TETHER_TERMINAL_MULTIPLEXER__

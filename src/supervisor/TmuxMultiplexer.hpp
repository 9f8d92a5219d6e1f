#ifndef __TETHER_TMUX_MULTIPLEXER__
#define __TETHER_TMUX_MULTIPLEXER__

#include "SubprocessUtils.hpp"
#include "SupervisorConfig.hpp"
#include "TerminalMultiplexer.hpp"

namespace tether {
/**
 * @brief tmux on a dedicated server socket.
 *
 * Commands too long for `new-session` are written to a launcher script that
 * tmux runs instead. The command line records its exit code in a status file
 * because the attach client only ever reports its own.
 */
class TmuxMultiplexer : public TerminalMultiplexer {
 public:
  /** @brief tmux rejects longer new-session commands. */
  static const size_t COMMAND_LENGTH_LIMIT = 1500;

  TmuxMultiplexer(const SupervisorConfig& config,
                  shared_ptr<SubprocessUtils> _subprocessUtils);
  virtual ~TmuxMultiplexer() {}

  virtual bool isAvailable();
  virtual string nameFor(const string& sessionId) { return prefix + sessionId; }
  virtual void createSession(const string& sessionId, const LaunchSpec& launch);
  virtual LaunchSpec attachCommand(const string& sessionId, int cols, int rows);
  virtual bool hasSession(const string& sessionId);
  virtual bool killSession(const string& sessionId);
  virtual optional<string> capturePane(const string& sessionId);
  virtual vector<string> listSessions();
  virtual void detachClients(const string& sessionId);
  virtual optional<int> reapSession(const string& sessionId);

  /** @brief Quotes a word for /bin/sh when it needs it. */
  static string shellQuote(const string& word);
  /** @brief Joins a command and its arguments into one shell command line. */
  static string shellCommand(const string& command, const vector<string>& args);

 protected:
  SubprocessResult tmux(const vector<string>& args);
  string launcherPath(const string& sessionId);
  string exitStatusPath(const string& sessionId);

  shared_ptr<SubprocessUtils> subprocessUtils;
  string socketName;
  string prefix;
  string configFile;
  int64_t timeoutMs;
  optional<bool> available;
  mutex availableMutex;
};
}  // namespace tether

#endif  // __TETHER_TMUX_MULTIPLEXER__

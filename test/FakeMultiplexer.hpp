#ifndef __TETHER_FAKE_MULTIPLEXER__
#define __TETHER_FAKE_MULTIPLEXER__

#include "SubprocessUtils.hpp"
#include "TerminalMultiplexer.hpp"

namespace tether {
/** @brief In-memory TerminalMultiplexer that records every call. */
class FakeMultiplexer : public TerminalMultiplexer {
 public:
  FakeMultiplexer() : available(true), failChecks(false), hangChecks(false) {}

  virtual bool isAvailable() { return available; }
  virtual string nameFor(const string& sessionId) { return "tw-" + sessionId; }
  virtual void createSession(const string& sessionId,
                             const LaunchSpec& launch) {
    lock_guard<mutex> guard(fakeMutex);
    sessions[sessionId] = launch;
  }
  virtual LaunchSpec attachCommand(const string& sessionId, int cols,
                                   int rows) {
    LaunchSpec launch;
    launch.command = "tmux";
    launch.args = {"attach-session", "-t", nameFor(sessionId)};
    launch.cols = cols;
    launch.rows = rows;
    return launch;
  }
  virtual bool hasSession(const string& sessionId) {
    if (failChecks) {
      throw std::runtime_error("tmux exploded");
    }
    if (hangChecks) {
      throw SubprocessTimeout("tmux has-session");
    }
    lock_guard<mutex> guard(fakeMutex);
    return sessions.count(sessionId) > 0;
  }
  virtual bool killSession(const string& sessionId) {
    lock_guard<mutex> guard(fakeMutex);
    killed.push_back(sessionId);
    return sessions.erase(sessionId) > 0;
  }
  virtual optional<string> capturePane(const string& sessionId) {
    lock_guard<mutex> guard(fakeMutex);
    auto it = captures.find(sessionId);
    if (it == captures.end()) {
      return nullopt;
    }
    return it->second;
  }
  virtual vector<string> listSessions() {
    lock_guard<mutex> guard(fakeMutex);
    vector<string> ids;
    for (const auto& it : sessions) {
      ids.push_back(it.first);
    }
    return ids;
  }
  virtual void detachClients(const string& sessionId) {
    lock_guard<mutex> guard(fakeMutex);
    detached.push_back(sessionId);
  }

  virtual optional<int> reapSession(const string& sessionId) {
    lock_guard<mutex> guard(fakeMutex);
    reaped.push_back(sessionId);
    auto it = exitCodes.find(sessionId);
    if (it == exitCodes.end()) {
      return nullopt;
    }
    return it->second;
  }

  /** @brief Pretends a session survived from an earlier run. */
  void addLiveSession(const string& sessionId, const string& capture) {
    lock_guard<mutex> guard(fakeMutex);
    sessions[sessionId] = LaunchSpec();
    captures[sessionId] = capture;
  }

  std::atomic<bool> available;
  std::atomic<bool> failChecks;
  std::atomic<bool> hangChecks;
  mutex fakeMutex;
  map<string, LaunchSpec> sessions;
  map<string, string> captures;
  map<string, int> exitCodes;
  vector<string> reaped;
  vector<string> killed;
  vector<string> detached;
};
}  // namespace tether

#endif  // __TETHER_FAKE_MULTIPLEXER__

#ifndef __TETHER_SESSION_TYPES__
#define __TETHER_SESSION_TYPES__

#include "Headers.hpp"

namespace tether {
enum class SessionStatus { PENDING, RUNNING, COMPLETED, FAILED, KILLED };

string sessionStatusToString(SessionStatus status);
/**
 * @throws std::runtime_error for strings that do not name a status.
 */
SessionStatus sessionStatusFromString(const string& s);
inline bool isTerminalStatus(SessionStatus status) {
  return status == SessionStatus::COMPLETED ||
         status == SessionStatus::FAILED || status == SessionStatus::KILLED;
}

/**
 * @brief What kind of process a session runs.
 *
 * AUTO runs a single non-interactive shot, YOLO runs autonomously without
 * confirmations, PLAIN runs an interactive shell instead of the agent.
 */
enum class PermissionProfile { INTERACTIVE, AUTO, YOLO, PLAIN };

string permissionProfileToString(PermissionProfile profile);
/** @brief Unknown strings map to INTERACTIVE. */
PermissionProfile permissionProfileFromString(const string& s);

/**
 * @brief Persisted state of one session, shared between the supervisor and
 * the record store.
 */
struct SessionRecord {
  string id;
  SessionStatus status = SessionStatus::PENDING;
  PermissionProfile permissionProfile = PermissionProfile::INTERACTIVE;
  optional<int64_t> processId;
  string startedAt;
  optional<string> completedAt;
  optional<int> exitCode;
  // Bounded tail of the output
  string outputLog;
  // Every byte ever produced, not capped
  int64_t outputBytes = 0;
  int64_t lastOutputSeq = 0;
  int64_t lastInputSeq = 0;
  optional<string> workerId;
  optional<string> multiplexName;
  optional<string> parentSessionId;
};

/** @brief What a caller asks the supervisor to run. */
struct SpawnRequest {
  string sessionId;
  string prompt;
  string cwd;
  PermissionProfile permissionProfile = PermissionProfile::INTERACTIVE;
  string allowedTools;
  // Id handed to the agent with --session-id
  string agentSessionId;
  // Agent conversation to continue with --resume
  string resumeSessionId;
  string parentSessionId;
};

class SpawnConflict : public std::runtime_error {
 public:
  explicit SpawnConflict(const string& sessionId)
      : std::runtime_error("Session " + sessionId + " is already running") {}
};

class SessionNotFound : public std::runtime_error {
 public:
  explicit SessionNotFound(const string& sessionId)
      : std::runtime_error("Session " + sessionId + " not found") {}
};

/**
 * @brief A session's process could not be reached.
 *
 * UNKNOWN means the liveness signal itself was unreachable, DEAD means the
 * process is confirmed gone.
 */
class ProcessUnavailable : public std::runtime_error {
 public:
  enum class Liveness { UNKNOWN, DEAD };

  ProcessUnavailable(const string& sessionId, Liveness _liveness)
      : std::runtime_error("Process for session " + sessionId + " is " +
                           (_liveness == Liveness::DEAD ? "dead" : "unknown")),
        liveness(_liveness) {}

  Liveness getLiveness() const { return liveness; }

 protected:
  Liveness liveness;
};

class StartupHealthFailure : public std::runtime_error {
 public:
  explicit StartupHealthFailure(const string& sessionId)
      : std::runtime_error("Session " + sessionId +
                           " produced no credible output after startup") {}
};

class RecoveryFailure : public std::runtime_error {
 public:
  RecoveryFailure(const string& sessionId, const string& reason)
      : std::runtime_error("Could not recover session " + sessionId + ": " +
                           reason) {}
};
}  // namespace tether

#endif  // __TETHER_SESSION_TYPES__

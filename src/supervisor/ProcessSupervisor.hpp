#ifndef __TETHER_PROCESS_SUPERVISOR__
#define __TETHER_PROCESS_SUPERVISOR__

#include "ActiveSession.hpp"
#include "CommandBuilder.hpp"
#include "Headers.hpp"
#include "OutputLedger.hpp"
#include "PacketChannel.hpp"
#include "SessionStore.hpp"
#include "SupervisorConfig.hpp"
#include "TerminalMultiplexer.hpp"

namespace tether {
class RecoveryManager;

/** @brief Snapshot returned by ProcessSupervisor::status. */
struct SessionStatusInfo {
  SessionStatus status;
  bool active;
  int64_t outputSeq;
  int64_t totalBytes;
  bool waitingForInput;
  // The process has printed something
  bool started;
};

/**
 * @brief Owns one interactive process per active session and streams its
 * output to attached viewers.
 *
 * Every session runs on its own thread that reads the process output and
 * serializes buffer append, waiting-state update, ledger append and fan-out.
 * Sessions never share a lock beyond the short lookup in the session map.
 */
class ProcessSupervisor {
 public:
  enum class AttachResult {
    // Attached to a live process handle
    ATTACHED,
    // Parked until the pending spawn completes
    PENDING,
    // History and an exit notice were sent, nothing to stream
    ENDED,
    NOT_FOUND,
    // The multiplexer did not answer; the viewer should reconnect later
    RETRY
  };

  ProcessSupervisor(const SupervisorConfig& _config,
                    shared_ptr<SessionStore> _store,
                    shared_ptr<OutputLedger> _ledger,
                    shared_ptr<ProcessFactory> _processFactory,
                    shared_ptr<TerminalMultiplexer> _multiplexer);
  virtual ~ProcessSupervisor();

  void setRecoveryManager(shared_ptr<RecoveryManager> _recoveryManager) {
    recoveryManager = _recoveryManager;
  }

  /**
   * @brief Starts a process for a session, inside the multiplexer when one
   * is available.
   * @throws SpawnConflict when the session already has a process handle.
   * @throws std::runtime_error when the process could not be started.
   */
  void spawn(const SpawnRequest& request);

  /**
   * @brief Kills a running session.
   * @return false (and does nothing) when the session is not active.
   */
  bool kill(const string& sessionId);

  /** @brief No-op unless the session is active. */
  void resize(const string& sessionId, int cols, int rows);
  /** @brief No-op unless the session is active. */
  void write(const string& sessionId, const string& data);

  /**
   * @brief Attaches a viewer: sends the history snapshot and registers the
   * viewer for live output, recovering the session first if the store says
   * it is running but no handle exists.
   */
  AttachResult attachViewer(const string& sessionId,
                            shared_ptr<PacketChannel> viewer);
  void detachViewer(const string& sessionId, shared_ptr<PacketChannel> viewer);
  /**
   * @brief Handles sequenced input, output acks, replay requests and
   * heartbeats from a viewer. Malformed payloads are logged and dropped.
   */
  void handleViewerPacket(const string& sessionId,
                          shared_ptr<PacketChannel> viewer,
                          const Packet& packet);

  /**
   * @brief Sends an exit notice to viewers parked on a spawn that failed.
   */
  void failPendingViewers(const string& sessionId);

  /**
   * @brief Creates a process handle that reattaches to a still-alive
   * multiplexed session instead of spawning a new process.
   * @throws SpawnConflict when the session already has a handle.
   */
  void reattach(const SessionRecord& record, const LaunchSpec& attachLaunch,
                const string& seedOutput, bool waitingForInput);

  optional<SessionStatusInfo> status(const string& sessionId);
  bool isActive(const string& sessionId);
  vector<string> activeSessionIds();
  map<string, bool> waitingStates();

  /** @brief Persists the output tail of every active session. */
  void flushAll();

  /**
   * @brief Flushes every session, detaches multiplexed ones so they survive
   * and kills raw processes. Exits seen afterwards are not reported.
   */
  void shutdown();

  bool isShuttingDown() const { return halt; }
  shared_ptr<TerminalMultiplexer> getMultiplexer() { return multiplexer; }
  shared_ptr<OutputLedger> getLedger() { return ledger; }

 protected:
  shared_ptr<ActiveSession> findSession(const string& sessionId);
  void startSessionThread(shared_ptr<ActiveSession> session);
  void runSession(shared_ptr<ActiveSession> session);

  void handleOutput(shared_ptr<ActiveSession> session, const string& data);
  void handleTick(shared_ptr<ActiveSession> session);
  void handleExit(shared_ptr<ActiveSession> session, int exitCode);

  /**
   * @brief Ends a session on our own initiative (kill or failed health
   * check).
   */
  bool terminateSession(shared_ptr<ActiveSession> session,
                        SessionStatus finalStatus);

  /** @brief Emits one sequenced message. Requires handleMutex. */
  void emitLocked(ActiveSession* session, const OutputContent& content);
  void appendOutputLocked(ActiveSession* session, const string& data);
  SessionRecord snapshotLocked(ActiveSession* session);
  void persistSnapshot(const SessionRecord& snapshot, bool final);
  void removeSession(shared_ptr<ActiveSession> session);

  static void sendHistory(shared_ptr<PacketChannel> viewer, const string& data,
                          int64_t lastInputAckSeq, bool waiting,
                          int64_t lastOutputSeq);
  static void sendExitNotice(shared_ptr<PacketChannel> viewer, int exitCode,
                             SessionStatus status);

  SupervisorConfig config;
  CommandBuilder commandBuilder;
  shared_ptr<SessionStore> store;
  shared_ptr<OutputLedger> ledger;
  shared_ptr<ProcessFactory> processFactory;
  shared_ptr<TerminalMultiplexer> multiplexer;
  shared_ptr<RecoveryManager> recoveryManager;

  /** @brief Guards sessions, spawning and pendingViewers. */
  mutex sessionsMutex;
  map<string, shared_ptr<ActiveSession>> sessions;
  /** @brief Ids whose spawn is in progress. */
  set<string> spawning;
  map<string, set<shared_ptr<PacketChannel>>> pendingViewers;

  struct SessionThread {
    shared_ptr<thread> t;
    shared_ptr<std::atomic<bool>> done;
  };
  mutex threadsMutex;
  vector<SessionThread> sessionThreads;
  std::atomic<bool> halt;
};
}  // namespace tether

#endif  // __TETHER_PROCESS_SUPERVISOR__

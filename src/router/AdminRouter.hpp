#ifndef __TETHER_ADMIN_ROUTER__
#define __TETHER_ADMIN_ROUTER__

#include "Headers.hpp"
#include "PacketChannel.hpp"
#include "SessionStore.hpp"
#include "SocketHandler.hpp"
#include "SupervisorLink.hpp"
#include "TerminalMultiplexer.hpp"
#include "WorkerRegistry.hpp"

namespace tether {
/**
 * @brief Connects each viewer either to the local supervisor or to the
 * remote worker running its session.
 *
 * A local bridge owns one upstream connection into the supervisor and
 * relays packets verbatim in both directions. A worker-routed viewer is
 * only a member of its session's viewer set; its input is wrapped in
 * WORKER_INPUT envelopes over the worker's shared connection.
 */
class AdminRouter {
 public:
  enum class AttachOutcome {
    // Bridged to a supervisor connection
    LOCAL,
    // Routed through a worker
    REMOTE,
    // Stored history (and exit) sent, nothing live to stream
    ENDED,
    // A CONNECTION_CLOSE was sent to the viewer
    CLOSED
  };

  AdminRouter(shared_ptr<SessionStore> _store,
              shared_ptr<WorkerRegistry> _workers,
              shared_ptr<SupervisorLink> _supervisorLink,
              shared_ptr<SocketHandler> _upstreamSocketHandler,
              const SocketEndpoint& _supervisorEndpoint,
              shared_ptr<TerminalMultiplexer> _multiplexer);
  virtual ~AdminRouter();

  AttachOutcome attach(const string& sessionId,
                       shared_ptr<PacketChannel> viewer);
  /** @brief Tears down whichever path the viewer used. */
  void detach(const string& sessionId, shared_ptr<PacketChannel> viewer);
  /** @brief Sends a viewer packet on towards the session. */
  void forward(shared_ptr<PacketChannel> viewer, const Packet& packet);

  /** @brief Upstream fd of a local bridge, or -1. */
  int getUpstreamFd(shared_ptr<PacketChannel> viewer);
  /**
   * @brief Relays whatever the supervisor sent on a local bridge.
   * @return false when the upstream connection is gone. The viewer has then
   * been sent a CONNECTION_CLOSE and should be closed.
   */
  bool relayUpstream(shared_ptr<PacketChannel> viewer);

  /**
   * @brief Kills a session wherever it runs. The record is marked killed
   * even if the process could not be reached.
   * @return true when a kill was sent or the record was moved to killed.
   */
  bool kill(const string& sessionId);

  /**
   * @brief Marks running records failed when every reachable liveness
   * signal agrees the session is gone.
   * @return Number of records marked failed.
   */
  int cleanupOrphanedSessions();

  void handleWorkerOutput(const WorkerSessionOutput& output);
  void handleWorkerSessionEnded(const WorkerSessionEnded& ended);

  size_t workerViewerCount(const string& sessionId);

 protected:
  struct Bridge {
    string sessionId;
    bool remote;
    int upstreamFd;
    string workerId;
  };

  AttachOutcome fallbackToStore(const string& sessionId,
                                shared_ptr<PacketChannel> viewer);
  void dropBridge(shared_ptr<PacketChannel> viewer);
  bool multiplexerHasSession(const string& sessionId);
  set<shared_ptr<PacketChannel>> getWorkerViewers(const string& sessionId);

  static void sendStoredHistory(shared_ptr<PacketChannel> viewer,
                                const SessionRecord& record);
  static void sendExitNotice(shared_ptr<PacketChannel> viewer, int exitCode,
                             const string& status);

  shared_ptr<SessionStore> store;
  shared_ptr<WorkerRegistry> workers;
  shared_ptr<SupervisorLink> supervisorLink;
  shared_ptr<SocketHandler> upstreamSocketHandler;
  SocketEndpoint supervisorEndpoint;
  shared_ptr<TerminalMultiplexer> multiplexer;

  /** @brief Guards bridges and workerViewers. */
  mutex bridgesMutex;
  map<shared_ptr<PacketChannel>, Bridge> bridges;
  map<string, set<shared_ptr<PacketChannel>>> workerViewers;
};
}  // namespace tether

#endif  // __TETHER_ADMIN_ROUTER__

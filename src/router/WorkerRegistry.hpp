#ifndef __TETHER_WORKER_REGISTRY__
#define __TETHER_WORKER_REGISTRY__

#include "Headers.hpp"
#include "PacketChannel.hpp"

namespace tether {
/** @brief What the router knows about one connected worker. */
struct WorkerInfo {
  string id;
  string name;
  string hostname;
  int maxSessions = 0;
  shared_ptr<PacketChannel> channel;
  // Session ids the worker last reported as running
  set<string> activeSessions;
  Clock::time_point lastSeen;
};

/**
 * @brief Remote workers keyed by id, each reachable through one shared
 * connection.
 */
class WorkerRegistry {
 public:
  /**
   * @brief Registers (or re-registers) a worker.
   * @return The channel of the worker it replaced, if any.
   */
  shared_ptr<PacketChannel> registerWorker(const WorkerRegister& registration,
                                           shared_ptr<PacketChannel> channel);

  /** @brief Refreshes the active set reported by a worker. */
  void heartbeat(const string& workerId, const WorkerHeartbeat& heartbeat);

  /**
   * @brief Removes a worker, unless its connection was already replaced by
   * a different one.
   */
  void removeWorker(const string& workerId, shared_ptr<PacketChannel> channel);

  optional<WorkerInfo> getWorker(const string& workerId);
  /** @brief True when the worker is registered and its channel is alive. */
  bool isLive(const string& workerId);
  vector<WorkerInfo> listWorkers();

  /**
   * @brief Drops workers not heard from within maxSilenceMs.
   * @return Channels of the dropped workers, for the caller to close.
   */
  vector<shared_ptr<PacketChannel>> pruneStale(int64_t maxSilenceMs);

 protected:
  mutex registryMutex;
  map<string, WorkerInfo> workers;
};
}  // namespace tether

#endif  // __TETHER_WORKER_REGISTRY__

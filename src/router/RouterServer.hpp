#ifndef __TETHER_ROUTER_SERVER__
#define __TETHER_ROUTER_SERVER__

#include "AdminRouter.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "PacketChannel.hpp"
#include "SocketHandler.hpp"
#include "WorkerRegistry.hpp"

namespace tether {
/** @brief Intervals and limits of the router daemon. */
struct RouterOptions {
  int64_t cleanupIntervalMs = 60 * 1000;
  int64_t workerPruneIntervalMs = 30 * 1000;
  int64_t workerMaxSilenceMs = 90 * 1000;
  int64_t viewerBufferBytes = 4 * 1024 * 1024;
};

/**
 * @brief Router daemon: accepts viewers and workers on their own endpoints
 * and serves the router's HTTP API.
 *
 * Each viewer and each worker connection is served by its own thread.
 */
class RouterServer {
 public:
  RouterServer(shared_ptr<SocketHandler> _socketHandler,
               const SocketEndpoint& _viewerEndpoint,
               const SocketEndpoint& _workerEndpoint,
               shared_ptr<AdminRouter> _router,
               shared_ptr<WorkerRegistry> _workers,
               const RouterOptions& _options);
  virtual ~RouterServer();

  /** @brief Accept loop. Returns after shutdown(). */
  void run();
  void shutdown() { halt = true; }

  void handleViewer(int fd);
  void handleWorker(int fd);

  /**
   * @brief Binds the HTTP API and serves it on a background thread.
   * @throws std::runtime_error when the address cannot be bound.
   */
  void startHttpApi(const string& host, int port);
  void stopHttpApi();

  json workersToJson();

 protected:
  struct ConnectionThread {
    shared_ptr<thread> t;
    shared_ptr<std::atomic<bool>> done;
  };

  void startConnectionThread(int fd, bool worker);
  void joinFinishedThreads(bool all);
  void pruneWorkers();

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint viewerEndpoint;
  SocketEndpoint workerEndpoint;
  shared_ptr<AdminRouter> router;
  shared_ptr<WorkerRegistry> workers;
  RouterOptions options;
  std::atomic<bool> halt;

  mutex connectionThreadMutex;
  vector<ConnectionThread> connectionThreads;

  httplib::Server httpServer;
  shared_ptr<thread> httpThread;
};
}  // namespace tether

#endif  // __TETHER_ROUTER_SERVER__

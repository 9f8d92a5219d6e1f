#ifndef __TETHER_SUPERVISOR_SERVER__
#define __TETHER_SUPERVISOR_SERVER__

#include "Headers.hpp"
#include "PacketChannel.hpp"
#include "ProcessSupervisor.hpp"
#include "SocketHandler.hpp"

namespace tether {
/**
 * @brief Accepts viewer connections on the supervisor endpoint and streams
 * each one's session.
 *
 * Every viewer is served by its own thread: it reads the VIEWER_ATTACH
 * packet, hands the connection to the ProcessSupervisor and then relays
 * viewer packets until either side goes away.
 */
class SupervisorServer {
 public:
  SupervisorServer(shared_ptr<SocketHandler> _socketHandler,
                   const SocketEndpoint& _endpoint,
                   shared_ptr<ProcessSupervisor> _supervisor,
                   const SupervisorConfig& _config);
  virtual ~SupervisorServer();

  /** @brief Accept loop. Returns after shutdown() once viewers are gone. */
  void run();
  /** @brief Stops the accept loop and every viewer thread. */
  void shutdown() { halt = true; }

  /** @brief Serves one viewer until it disconnects. Closes fd. */
  void handleViewer(int fd);

 protected:
  struct ViewerThread {
    shared_ptr<thread> t;
    shared_ptr<std::atomic<bool>> done;
  };

  void joinFinishedThreads(bool all);

  shared_ptr<SocketHandler> socketHandler;
  SocketEndpoint endpoint;
  shared_ptr<ProcessSupervisor> supervisor;
  SupervisorConfig config;
  std::atomic<bool> halt;
  mutex viewerThreadMutex;
  vector<ViewerThread> viewerThreads;
};
}  // namespace tether

#endif  // __TETHER_SUPERVISOR_SERVER__

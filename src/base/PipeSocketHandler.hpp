#ifndef __TETHER_PIPE_SOCKET_HANDLER__
#define __TETHER_PIPE_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace tether {
/**
 * @brief SocketHandler over UNIX domain sockets named by a filesystem path.
 *
 * All sockets are non-blocking; writes never wait for the peer.
 */
class PipeSocketHandler : public SocketHandler {
 public:
  PipeSocketHandler();
  virtual ~PipeSocketHandler() {}

  virtual bool waitForData(int fd, int64_t timeoutMs);
  virtual ssize_t read(int fd, void* buf, size_t count);
  virtual ssize_t write(int fd, const void* buf, size_t count);
  /**
   * @brief Connects to the socket at the endpoint's path.
   * @return The connected fd or -1 when nobody is listening there.
   */
  virtual int connect(const SocketEndpoint& endpoint);
  /**
   * @brief Creates a listening UNIX socket, replacing any stale socket file.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint);
  virtual int accept(int fd);
  virtual void stopListening(const SocketEndpoint& endpoint);
  virtual void close(int fd);

 protected:
  void initSocket(int fd);

  /** @brief Connected sockets that are still open. */
  set<int> activeSockets;
  /** @brief Tracks path -> listening socket descriptor. */
  map<string, int> pipeServerSockets;
  /** @brief Guards both maps. */
  recursive_mutex globalMutex;
};
}  // namespace tether

#endif  // __TETHER_PIPE_SOCKET_HANDLER__

#ifndef __TETHER_FAKE_SOCKET_HANDLER__
#define __TETHER_FAKE_SOCKET_HANDLER__

#include "SocketHandler.hpp"

namespace tether {
/**
 * @brief SocketHandler over anonymous socketpairs, for wiring a
 * PacketChannel to a test without any filesystem endpoint.
 */
class FakeSocketHandler : public SocketHandler {
 public:
  virtual ~FakeSocketHandler() {
    for (int fd : openFds) {
      ::close(fd);
    }
  }

  /** @brief Returns two connected non-blocking fds. */
  pair<int, int> createPair() {
    int fds[2];
    FATAL_FAIL(::socketpair(AF_UNIX, SOCK_STREAM, 0, fds));
    for (int fd : fds) {
      int opts = fcntl(fd, F_GETFL);
      FATAL_FAIL(fcntl(fd, F_SETFL, opts | O_NONBLOCK));
      lock_guard<mutex> guard(fdMutex);
      openFds.insert(fd);
    }
    return make_pair(fds[0], fds[1]);
  }

  virtual bool waitForData(int fd, int64_t timeoutMs) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    return ::poll(&pfd, 1, int(timeoutMs)) > 0;
  }
  virtual ssize_t read(int fd, void* buf, size_t count) {
    return ::read(fd, buf, count);
  }
  virtual ssize_t write(int fd, const void* buf, size_t count) {
    return ::send(fd, buf, count, MSG_NOSIGNAL | MSG_DONTWAIT);
  }
  virtual int connect(const SocketEndpoint&) { return -1; }
  virtual set<int> listen(const SocketEndpoint&) { return {}; }
  virtual int accept(int) { return -1; }
  virtual void stopListening(const SocketEndpoint&) {}
  virtual void close(int fd) {
    lock_guard<mutex> guard(fdMutex);
    if (openFds.erase(fd)) {
      ::close(fd);
    }
  }
  /** @brief Reads every packet that arrives within timeoutMs of the last. */
  vector<Packet> readPackets(int fd, int64_t timeoutMs = 200) {
    vector<Packet> packets;
    try {
      while (waitForData(fd, timeoutMs)) {
        Packet packet;
        if (readPacket(fd, &packet)) {
          packets.push_back(packet);
        }
      }
    } catch (const std::runtime_error&) {
      // Peer closed
    }
    return packets;
  }

  /** @brief Reads packets until one with the given header shows up. */
  optional<Packet> readUntil(int fd, PacketType type,
                             int64_t timeoutMs = 5000) {
    auto start = Clock::now();
    while (millisSince(start) < timeoutMs) {
      if (!waitForData(fd, 10)) {
        continue;
      }
      Packet packet;
      try {
        if (readPacket(fd, &packet) && packet.getHeader() == type) {
          return packet;
        }
      } catch (const std::runtime_error&) {
        return nullopt;
      }
    }
    return nullopt;
  }

 protected:
  mutex fdMutex;
  set<int> openFds;
};
}  // namespace tether

#endif  // __TETHER_FAKE_SOCKET_HANDLER__

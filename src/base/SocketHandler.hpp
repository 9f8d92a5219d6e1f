#ifndef __TETHER_SOCKET_HANDLER__
#define __TETHER_SOCKET_HANDLER__

#include "Headers.hpp"
#include "Packet.hpp"

namespace tether {
/** @brief Largest frame accepted from a peer. */
const int64_t MAX_FRAME_BYTES = 128 * 1024 * 1024;

/**
 * @brief Provides an abstract API for socket reads/writes and lifecycle
 * management.
 *
 * Frames are an int64 length followed by a serialized `Packet`.
 */
class SocketHandler {
 public:
  virtual ~SocketHandler() {}

  /**
   * @brief Waits up to `timeoutMs` for fd to become readable.
   */
  virtual bool waitForData(int fd, int64_t timeoutMs) = 0;
  /** @brief Returns true when data can be read from fd without blocking. */
  inline bool hasData(int fd) { return waitForData(fd, 0); }
  /**
   * @brief Reads up to count bytes from fd.
   */
  virtual ssize_t read(int fd, void* buf, size_t count) = 0;
  /**
   * @brief Writes up to count bytes to fd without blocking.
   * @return Bytes written, or -1 with errno set (EAGAIN when the socket is
   * full).
   */
  virtual ssize_t write(int fd, const void* buf, size_t count) = 0;

  /**
   * @brief Reads exactly `count` bytes, retrying on EAGAIN until the buffer
   * fills.
   * @param timeout Whether to enforce the transfer timeout while waiting.
   */
  void readAll(int fd, void* buf, size_t count, bool timeout);
  /**
   * @brief Attempts to write all bytes, throwing if the operation times out or
   * fails.
   */
  void writeAllOrThrow(int fd, const void* buf, size_t count, bool timeout);

  /** @brief Serializes a packet with its length prefix. */
  static string framePacket(const Packet& packet) {
    return frameSerialized(packet.serialize());
  }
  /** @brief Adds the length prefix to an already serialized packet. */
  static string frameSerialized(const string& serializedPacket);

  /**
   * @brief Reads a length-prefixed packet.
   * @returns false when the frame is empty.
   * @throws std::runtime_error when the peer disconnected or sent garbage.
   */
  bool readPacket(int fd, Packet* packet);

  /** @brief Writes a length-prefixed packet, throwing on failure. */
  inline void writePacket(int fd, const Packet& packet) {
    string s = framePacket(packet);
    writeAllOrThrow(fd, s.data(), s.length(), true);
  }

  /**
   * @brief Opens a connection to the specified endpoint.
   * @return File descriptor representing the socket (or -1 on failure).
   */
  virtual int connect(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Starts listening on the endpoint and returns the active listen fds.
   */
  virtual set<int> listen(const SocketEndpoint& endpoint) = 0;
  /**
   * @brief Accepts a pending connection on the given listening fd.
   * @return The new fd, or -1 when nothing was pending.
   */
  virtual int accept(int fd) = 0;
  /**
   * @brief Stops accepting new connections on the given endpoint.
   */
  virtual void stopListening(const SocketEndpoint& endpoint) = 0;
  /** @brief Closes the supplied socket descriptor. */
  virtual void close(int fd) = 0;
};
}  // namespace tether

#endif  // __TETHER_SOCKET_HANDLER__

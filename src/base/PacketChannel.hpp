#ifndef __TETHER_PACKET_CHANNEL__
#define __TETHER_PACKET_CHANNEL__

#include "Headers.hpp"
#include "SocketHandler.hpp"
#include "WriteBuffer.hpp"

namespace tether {
/**
 * @brief Non-blocking packet sender for one connected socket.
 *
 * Packets are framed and queued; whatever the socket does not take right
 * away stays queued for the next flush. A peer that stops reading until the
 * queue overflows, or whose socket fails, marks the channel dead. The
 * channel never closes the fd itself.
 */
class PacketChannel {
 public:
  PacketChannel(shared_ptr<SocketHandler> _socketHandler, int _fd,
                size_t maxBufferedBytes);

  int getFd() const { return fd; }
  /** @brief Unique id used to tell connections apart in logs. */
  const string& getId() const { return id; }

  /**
   * @brief Queues a packet and tries to send it.
   * @return false when the channel is (now) dead.
   */
  bool send(const Packet& packet);
  /** @brief Same as send, for a packet that was already serialized. */
  bool sendSerialized(const string& serializedPacket);

  /**
   * @brief Writes as much queued data as the socket accepts.
   * @return false when the channel is dead.
   */
  bool flush();

  /** @brief Queues a CONNECTION_CLOSE packet for the peer. */
  bool sendClose(CloseCode code, const string& reason);
  /**
   * @brief Keeps flushing for up to timeoutMs so a peer about to be closed
   * still receives what was queued.
   */
  void drain(int64_t timeoutMs);

  bool hasPendingData();
  bool isDead();
  void markDead();

 protected:
  bool flushLocked();

  shared_ptr<SocketHandler> socketHandler;
  int fd;
  string id;
  mutex channelMutex;
  WriteBuffer writeBuffer;
  bool dead;
};
}  // namespace tether

#endif  // __TETHER_PACKET_CHANNEL__

#include "PacketChannel.hpp"

namespace tether {
PacketChannel::PacketChannel(shared_ptr<SocketHandler> _socketHandler,
                             int _fd, size_t maxBufferedBytes)
    : socketHandler(_socketHandler),
      fd(_fd),
      id(sole::uuid4().str()),
      writeBuffer(maxBufferedBytes),
      dead(false) {}

bool PacketChannel::send(const Packet& packet) {
  return sendSerialized(packet.serialize());
}

bool PacketChannel::sendSerialized(const string& serializedPacket) {
  lock_guard<mutex> guard(channelMutex);
  if (dead) {
    return false;
  }
  string frame = SocketHandler::frameSerialized(serializedPacket);
  if (!writeBuffer.enqueue(frame)) {
    LOG(WARNING) << "Peer on fd " << fd << " stopped reading ("
                 << writeBuffer.size() << " bytes queued), dropping it";
    dead = true;
    writeBuffer.clear();
    return false;
  }
  return flushLocked();
}

bool PacketChannel::flush() {
  lock_guard<mutex> guard(channelMutex);
  return flushLocked();
}

bool PacketChannel::flushLocked() {
  if (dead) {
    return false;
  }
  while (writeBuffer.hasPendingData()) {
    size_t count;
    const char* data = writeBuffer.peekData(&count);
    ssize_t written = socketHandler->write(fd, data, count);
    if (written < 0) {
      auto localErrno = errno;
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // Try again on the next flush
        return true;
      }
      VLOG(1) << "Write to fd " << fd << " failed: " << strerror(localErrno);
      dead = true;
      writeBuffer.clear();
      return false;
    }
    if (written == 0) {
      return true;
    }
    writeBuffer.consume(written);
  }
  return true;
}

bool PacketChannel::sendClose(CloseCode code, const string& reason) {
  ConnectionClose close;
  close.set_code(code);
  close.set_reason(reason);
  return send(Packet::fromProto(PacketType::CONNECTION_CLOSE, close));
}

void PacketChannel::drain(int64_t timeoutMs) {
  auto start = Clock::now();
  while (flush() && hasPendingData() && millisSince(start) < timeoutMs) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

bool PacketChannel::hasPendingData() {
  lock_guard<mutex> guard(channelMutex);
  return writeBuffer.hasPendingData();
}

bool PacketChannel::isDead() {
  lock_guard<mutex> guard(channelMutex);
  return dead;
}

void PacketChannel::markDead() {
  lock_guard<mutex> guard(channelMutex);
  dead = true;
  writeBuffer.clear();
}
}  // namespace tether

#include "SocketHandler.hpp"

namespace tether {
namespace {
// A transfer fails when no byte moved for this long
const int64_t TRANSFER_IDLE_TIMEOUT_MS = 10 * 1000;

bool isRetryable(int err) { return err == EAGAIN || err == EWOULDBLOCK; }
}  // namespace

void SocketHandler::readAll(int fd, void* buf, size_t count, bool timeout) {
  char* out = static_cast<char*>(buf);
  size_t pos = 0;
  auto lastProgress = Clock::now();
  while (pos < count) {
    if (!waitForData(fd, 1000)) {
      if (timeout && millisSince(lastProgress) > TRANSFER_IDLE_TIMEOUT_MS) {
        throw std::runtime_error("Socket read timed out");
      }
      continue;
    }
    ssize_t bytesRead = read(fd, out + pos, count - pos);
    if (bytesRead == 0) {
      throw std::runtime_error("Peer closed the connection");
    }
    if (bytesRead < 0) {
      int err = errno;
      if (isRetryable(err)) {
        continue;
      }
      VLOG(1) << "Read from " << fd << " failed: " << strerror(err);
      throw std::runtime_error(string("Socket read failed: ") + strerror(err));
    }
    pos += bytesRead;
    lastProgress = Clock::now();
  }
}

void SocketHandler::writeAllOrThrow(int fd, const void* buf, size_t count,
                                    bool timeout) {
  const char* in = static_cast<const char*>(buf);
  size_t pos = 0;
  auto lastProgress = Clock::now();
  while (pos < count) {
    if (timeout && millisSince(lastProgress) > TRANSFER_IDLE_TIMEOUT_MS) {
      throw std::runtime_error("Socket write timed out");
    }
    ssize_t bytesWritten = write(fd, in + pos, count - pos);
    if (bytesWritten == 0) {
      throw std::runtime_error("Socket closed during write");
    }
    if (bytesWritten < 0) {
      int err = errno;
      if (isRetryable(err)) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
        continue;
      }
      LOG(WARNING) << "Write to " << fd << " failed: " << strerror(err);
      throw std::runtime_error(string("Socket write failed: ") + strerror(err));
    }
    pos += bytesWritten;
    lastProgress = Clock::now();
  }
}

string SocketHandler::frameSerialized(const string& s) {
  int64_t length = s.length();
  if (length > MAX_FRAME_BYTES) {
    STFATAL << "Invalid message length: " << length;
  }
  string frame(sizeof(int64_t), '\0');
  memcpy(&frame[0], &length, sizeof(int64_t));
  frame.append(s);
  return frame;
}

bool SocketHandler::readPacket(int fd, Packet* packet) {
  int64_t length;
  readAll(fd, (char*)&length, sizeof(int64_t), true);
  if (length < 0 || length > MAX_FRAME_BYTES) {
    throw std::runtime_error("Invalid frame size: " + std::to_string(length));
  }
  if (length == 0) {
    return false;
  }
  string s(length, '\0');
  readAll(fd, &s[0], length, true);
  *packet = Packet(s);
  return true;
}
}  // namespace tether

#ifndef __TETHER_WRITE_BUFFER__
#define __TETHER_WRITE_BUFFER__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Bounded queue of bytes waiting for a non-blocking socket.
 *
 * Enqueue refuses data that would push the buffer past its limit, which is
 * how a stalled reader is detected.
 */
class WriteBuffer {
 public:
  explicit WriteBuffer(size_t _maxBytes)
      : maxBytes(_maxBytes), totalBytes(0), writeOffset(0) {}

  bool hasPendingData() const { return !pending.empty(); }

  size_t size() const { return totalBytes; }

  /**
   * @brief Adds data to the end of the buffer.
   * @return false (and leaves the buffer unchanged) when it would overflow.
   */
  bool enqueue(const string &data) {
    if (data.empty()) return true;
    if (totalBytes + data.size() > maxBytes) {
      return false;
    }
    pending.push_back(data);
    totalBytes += data.size();
    return true;
  }

  /**
   * @brief Returns a pointer to the next bytes to write and the count.
   */
  const char *peekData(size_t *count) const {
    if (pending.empty()) {
      *count = 0;
      return nullptr;
    }
    const string &front = pending.front();
    *count = front.size() - writeOffset;
    return front.data() + writeOffset;
  }

  /**
   * @brief Removes bytesWritten from the front of the buffer.
   */
  void consume(size_t bytesWritten) {
    while (bytesWritten > 0 && !pending.empty()) {
      string &front = pending.front();
      size_t available = front.size() - writeOffset;

      if (bytesWritten >= available) {
        bytesWritten -= available;
        totalBytes -= available;
        writeOffset = 0;
        pending.pop_front();
      } else {
        // Partial write
        writeOffset += bytesWritten;
        totalBytes -= bytesWritten;
        bytesWritten = 0;
      }
    }
  }

  void clear() {
    pending.clear();
    totalBytes = 0;
    writeOffset = 0;
  }

 private:
  size_t maxBytes;
  std::deque<string> pending;
  size_t totalBytes;
  size_t writeOffset;
};
}  // namespace tether

#endif  // __TETHER_WRITE_BUFFER__

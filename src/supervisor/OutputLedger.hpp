#ifndef __TETHER_OUTPUT_LEDGER__
#define __TETHER_OUTPUT_LEDGER__

#include "Headers.hpp"

namespace tether {
/** @brief One sequenced message exactly as it was first sent. */
struct LedgerEntry {
  int64_t seq;
  OutputContent::Kind kind;
  // Serialized Packet (header byte + SequencedOutput)
  string packet;
  Clock::time_point appendedAt;
};

/**
 * @brief Per-session, sequence-indexed log of everything sent to viewers.
 *
 * Entries are retired by acknowledgement, by age and by a per-session cap.
 * Replay returns a gap-free suffix of what is still retained. The log of a
 * session outlives its process handle until clearSession is called or prune
 * finds it empty and idle for longer than the TTL.
 */
class OutputLedger {
 public:
  OutputLedger(int64_t _maxEntries, int64_t _ttlMs);

  /**
   * @brief Appends an entry. Sequence numbers must be strictly increasing per
   * session; a regression discards the stale entries first.
   */
  void append(const string& sessionId, int64_t seq, OutputContent::Kind kind,
              const string& packet);

  /** @brief Returns retained entries with seq > fromSeq, in order. */
  vector<LedgerEntry> replay(const string& sessionId, int64_t fromSeq);

  /** @brief Retires every entry with seq <= ackSeq. */
  void ack(const string& sessionId, int64_t ackSeq);

  /** @brief Highest sequence number ever appended (0 when none). */
  int64_t lastSeq(const string& sessionId);

  /** @brief Number of retained entries. */
  size_t size(const string& sessionId);

  void clearSession(const string& sessionId);

  /**
   * @brief Drops expired entries of every session, then forgets sessions with
   * nothing retained and no append within the TTL.
   */
  void prune();

  /** @brief Number of sessions with a log. */
  size_t sessionCount();

 protected:
  struct SessionLog {
    mutex logMutex;
    deque<LedgerEntry> entries;
    int64_t lastSeq = 0;
    Clock::time_point lastAppend = Clock::now();
  };

  shared_ptr<SessionLog> getLog(const string& sessionId);
  void pruneExpired(SessionLog* log, Clock::time_point now);

  int64_t maxEntries;
  std::chrono::milliseconds ttl;
  mutex logsMutex;
  unordered_map<string, shared_ptr<SessionLog>> logs;
};
}  // namespace tether

#endif  // __TETHER_OUTPUT_LEDGER__

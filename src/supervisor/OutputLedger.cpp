#include "OutputLedger.hpp"

namespace tether {
OutputLedger::OutputLedger(int64_t _maxEntries, int64_t _ttlMs)
    : maxEntries(_maxEntries), ttl(_ttlMs) {}

shared_ptr<OutputLedger::SessionLog> OutputLedger::getLog(
    const string& sessionId) {
  lock_guard<mutex> guard(logsMutex);
  auto it = logs.find(sessionId);
  if (it == logs.end()) {
    return nullptr;
  }
  return it->second;
}

void OutputLedger::pruneExpired(SessionLog* log, Clock::time_point now) {
  while (!log->entries.empty() && now - log->entries.front().appendedAt >= ttl) {
    log->entries.pop_front();
  }
}

void OutputLedger::append(const string& sessionId, int64_t seq,
                          OutputContent::Kind kind, const string& packet) {
  // The log is locked before logsMutex is released so prune cannot forget it
  // in between
  unique_lock<mutex> logsGuard(logsMutex);
  auto& slot = logs[sessionId];
  if (!slot) {
    slot = make_shared<SessionLog>();
  }
  auto log = slot;
  lock_guard<mutex> guard(log->logMutex);
  logsGuard.unlock();

  if (seq <= log->lastSeq) {
    LOG(WARNING) << "Sequence for " << sessionId << " went back from "
                 << log->lastSeq << " to " << seq
                 << ", discarding stale ledger entries";
    log->entries.clear();
  }
  auto now = Clock::now();
  pruneExpired(log.get(), now);
  while (int64_t(log->entries.size()) >= maxEntries && !log->entries.empty()) {
    log->entries.pop_front();
  }
  LedgerEntry entry;
  entry.seq = seq;
  entry.kind = kind;
  entry.packet = packet;
  entry.appendedAt = now;
  log->entries.push_back(entry);
  log->lastSeq = seq;
  log->lastAppend = now;
}

vector<LedgerEntry> OutputLedger::replay(const string& sessionId,
                                         int64_t fromSeq) {
  vector<LedgerEntry> result;
  auto log = getLog(sessionId);
  if (!log) {
    return result;
  }
  lock_guard<mutex> guard(log->logMutex);
  pruneExpired(log.get(), Clock::now());
  for (const auto& entry : log->entries) {
    if (entry.seq > fromSeq) {
      result.push_back(entry);
    }
  }
  VLOG(1) << "Replaying " << result.size() << " entries of " << sessionId
          << " after seq " << fromSeq;
  return result;
}

void OutputLedger::ack(const string& sessionId, int64_t ackSeq) {
  auto log = getLog(sessionId);
  if (!log) {
    return;
  }
  lock_guard<mutex> guard(log->logMutex);
  while (!log->entries.empty() && log->entries.front().seq <= ackSeq) {
    log->entries.pop_front();
  }
}

int64_t OutputLedger::lastSeq(const string& sessionId) {
  auto log = getLog(sessionId);
  if (!log) {
    return 0;
  }
  lock_guard<mutex> guard(log->logMutex);
  return log->lastSeq;
}

size_t OutputLedger::size(const string& sessionId) {
  auto log = getLog(sessionId);
  if (!log) {
    return 0;
  }
  lock_guard<mutex> guard(log->logMutex);
  return log->entries.size();
}

void OutputLedger::clearSession(const string& sessionId) {
  lock_guard<mutex> guard(logsMutex);
  logs.erase(sessionId);
}

void OutputLedger::prune() {
  auto now = Clock::now();
  lock_guard<mutex> guard(logsMutex);
  for (auto it = logs.begin(); it != logs.end();) {
    auto& log = it->second;
    lock_guard<mutex> logGuard(log->logMutex);
    pruneExpired(log.get(), now);
    if (log->entries.empty() && now - log->lastAppend >= ttl) {
      VLOG(1) << "Forgetting idle ledger of " << it->first;
      it = logs.erase(it);
    } else {
      ++it;
    }
  }
}

size_t OutputLedger::sessionCount() {
  lock_guard<mutex> guard(logsMutex);
  return logs.size();
}
}  // namespace tether

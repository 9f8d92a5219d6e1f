#include "RecoveryManager.hpp"

#include "OutputHeuristics.hpp"
#include "ProcessSupervisor.hpp"

namespace tether {
RecoveryManager::RecoveryManager(ProcessSupervisor* _supervisor,
                                 shared_ptr<SessionStore> _store,
                                 shared_ptr<TerminalMultiplexer> _multiplexer,
                                 const SupervisorConfig& _config)
    : supervisor(_supervisor),
      store(_store),
      multiplexer(_multiplexer),
      config(_config) {}

RecoveryManager::Outcome RecoveryManager::tryRecover(
    const SessionRecord& record) {
  lock_guard<recursive_mutex> guard(recoveryMutex);
  if (supervisor->isActive(record.id)) {
    return Outcome::RECOVERED;
  }
  if (!multiplexer) {
    return Outcome::GONE;
  }
  try {
    if (!multiplexer->isAvailable() || !multiplexer->hasSession(record.id)) {
      VLOG(1) << "No multiplexed session left for " << record.id;
      return Outcome::GONE;
    }
    optional<string> captured = multiplexer->capturePane(record.id);
    string seed = captured ? *captured : record.outputLog;
    bool waiting = captured && looksLikeInteractivePrompt(*captured);
    LaunchSpec attach = multiplexer->attachCommand(
        record.id, config.defaultCols, config.defaultRows);
    supervisor->reattach(record, attach, seed, waiting);
    LOG(INFO) << "Recovered session " << record.id << " ("
              << (captured ? "captured pane" : "stored tail")
              << ", waiting=" << waiting << ")";
    return Outcome::RECOVERED;
  } catch (const SpawnConflict&) {
    // Somebody else reattached first
    return supervisor->isActive(record.id) ? Outcome::RECOVERED
                                           : Outcome::GONE;
  } catch (const SubprocessTimeout& st) {
    LOG(WARNING) << "Multiplexer did not answer for " << record.id << ": "
                 << st.what();
    return Outcome::UNREACHABLE;
  } catch (const std::exception& ex) {
    RecoveryFailure failure(record.id, ex.what());
    LOG(WARNING) << failure.what();
    return Outcome::GONE;
  }
}

void RecoveryManager::markStale(const string& sessionId) {
  string completedAt = nowIso8601();
  store->update(sessionId, [&](SessionRecord* r) {
    if (r->status == SessionStatus::RUNNING) {
      r->status = SessionStatus::FAILED;
      r->completedAt = completedAt;
    }
  });
}

int RecoveryManager::recoverAll() {
  lock_guard<recursive_mutex> guard(recoveryMutex);
  vector<SessionRecord> running = store->listByStatus(SessionStatus::RUNNING);
  bool available = false;
  if (multiplexer) {
    try {
      available = multiplexer->isAvailable();
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Multiplexer probe failed: " << ex.what();
    }
  }

  if (!available) {
    for (const auto& record : running) {
      LOG(INFO) << "No multiplexer, marking " << record.id << " failed";
      markStale(record.id);
    }
    return 0;
  }

  int recovered = 0;
  for (const auto& record : running) {
    switch (tryRecover(record)) {
      case Outcome::RECOVERED:
        recovered++;
        break;
      case Outcome::GONE:
        LOG(INFO) << "Session " << record.id
                  << " did not survive the restart, marking it failed";
        markStale(record.id);
        break;
      case Outcome::UNREACHABLE:
        LOG(INFO) << "Leaving " << record.id
                  << " running until the multiplexer answers";
        break;
    }
  }

  // A record can be marked failed while its multiplexed session is still
  // alive, e.g. by a cleanup pass that ran while we were down
  vector<string> live;
  try {
    live = multiplexer->listSessions();
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Could not list multiplexed sessions: " << ex.what();
  }
  for (const auto& sessionId : live) {
    if (supervisor->isActive(sessionId)) {
      continue;
    }
    auto record = store->get(sessionId);
    if (!record || record->status != SessionStatus::FAILED) {
      continue;
    }
    LOG(INFO) << "Reopening failed session " << sessionId
              << " whose multiplexed session is alive";
    if (tryRecover(*record) == Outcome::RECOVERED) {
      recovered++;
    }
  }
  LOG(INFO) << "Recovered " << recovered << " sessions";
  return recovered;
}
}  // namespace tether

#include "AdminRouter.hpp"

namespace tether {
namespace {
// Packets relayed per call so one chatty session cannot starve its viewer
const int MAX_RELAY_BATCH = 64;
}  // namespace

AdminRouter::AdminRouter(shared_ptr<SessionStore> _store,
                         shared_ptr<WorkerRegistry> _workers,
                         shared_ptr<SupervisorLink> _supervisorLink,
                         shared_ptr<SocketHandler> _upstreamSocketHandler,
                         const SocketEndpoint& _supervisorEndpoint,
                         shared_ptr<TerminalMultiplexer> _multiplexer)
    : store(_store),
      workers(_workers),
      supervisorLink(_supervisorLink),
      upstreamSocketHandler(_upstreamSocketHandler),
      supervisorEndpoint(_supervisorEndpoint),
      multiplexer(_multiplexer) {}

AdminRouter::~AdminRouter() {
  lock_guard<mutex> guard(bridgesMutex);
  for (auto& it : bridges) {
    if (!it.second.remote && it.second.upstreamFd >= 0) {
      upstreamSocketHandler->close(it.second.upstreamFd);
    }
  }
  bridges.clear();
}

void AdminRouter::sendStoredHistory(shared_ptr<PacketChannel> viewer,
                                    const SessionRecord& record) {
  History history;
  history.set_data(record.outputLog);
  history.set_last_input_ack_seq(record.lastInputSeq);
  history.set_waiting_for_input(false);
  history.set_last_output_seq(record.lastOutputSeq);
  viewer->send(Packet::fromProto(PacketType::HISTORY, history));
}

void AdminRouter::sendExitNotice(shared_ptr<PacketChannel> viewer,
                                 int exitCode, const string& status) {
  ExitNotice notice;
  notice.set_exit_code(exitCode);
  notice.set_status(status);
  viewer->send(Packet::fromProto(PacketType::EXIT_NOTICE, notice));
}

AdminRouter::AttachOutcome AdminRouter::attach(
    const string& sessionId, shared_ptr<PacketChannel> viewer) {
  auto record = store->get(sessionId);
  if (record && record->workerId && workers->isLive(*record->workerId)) {
    {
      lock_guard<mutex> guard(bridgesMutex);
      Bridge bridge;
      bridge.sessionId = sessionId;
      bridge.remote = true;
      bridge.upstreamFd = -1;
      bridge.workerId = *record->workerId;
      bridges[viewer] = bridge;
      workerViewers[sessionId].insert(viewer);
    }
    sendStoredHistory(viewer, *record);
    if (isTerminalStatus(record->status)) {
      sendExitNotice(viewer, record->exitCode.value_or(-1),
                     sessionStatusToString(record->status));
    }
    LOG(INFO) << "Viewer " << viewer->getId() << " routed to worker "
              << *record->workerId << " for " << sessionId;
    return AttachOutcome::REMOTE;
  }

  int fd = upstreamSocketHandler->connect(supervisorEndpoint);
  if (fd < 0) {
    LOG(WARNING) << "Supervisor unreachable for " << sessionId;
    return fallbackToStore(sessionId, viewer);
  }
  try {
    ViewerAttach viewerAttach;
    viewerAttach.set_session_id(sessionId);
    upstreamSocketHandler->writePacket(
        fd, Packet::fromProto(PacketType::VIEWER_ATTACH, viewerAttach));
  } catch (const std::runtime_error& ex) {
    LOG(WARNING) << "Supervisor dropped the attach of " << sessionId << ": "
                 << ex.what();
    upstreamSocketHandler->close(fd);
    return fallbackToStore(sessionId, viewer);
  }

  lock_guard<mutex> guard(bridgesMutex);
  Bridge bridge;
  bridge.sessionId = sessionId;
  bridge.remote = false;
  bridge.upstreamFd = fd;
  bridges[viewer] = bridge;
  VLOG(1) << "Viewer " << viewer->getId() << " bridged to supervisor fd "
          << fd << " for " << sessionId;
  return AttachOutcome::LOCAL;
}

AdminRouter::AttachOutcome AdminRouter::fallbackToStore(
    const string& sessionId, shared_ptr<PacketChannel> viewer) {
  auto record = store->get(sessionId);
  if (!record) {
    viewer->sendClose(CLOSE_SESSION_NOT_FOUND, "Session not found");
    return AttachOutcome::CLOSED;
  }
  if (!isTerminalStatus(record->status)) {
    // Stale output would look like a live session; make the viewer retry
    viewer->sendClose(CLOSE_SUPERVISOR_UNREACHABLE,
                      "Supervisor unreachable, retry");
    return AttachOutcome::CLOSED;
  }
  sendStoredHistory(viewer, *record);
  sendExitNotice(viewer, record->exitCode.value_or(-1),
                 sessionStatusToString(record->status));
  return AttachOutcome::ENDED;
}

void AdminRouter::dropBridge(shared_ptr<PacketChannel> viewer) {
  lock_guard<mutex> guard(bridgesMutex);
  auto it = bridges.find(viewer);
  if (it == bridges.end()) {
    return;
  }
  if (it->second.remote) {
    auto viewersIt = workerViewers.find(it->second.sessionId);
    if (viewersIt != workerViewers.end()) {
      viewersIt->second.erase(viewer);
      if (viewersIt->second.empty()) {
        workerViewers.erase(viewersIt);
      }
    }
  } else if (it->second.upstreamFd >= 0) {
    upstreamSocketHandler->close(it->second.upstreamFd);
  }
  bridges.erase(it);
}

void AdminRouter::detach(const string& sessionId,
                         shared_ptr<PacketChannel> viewer) {
  VLOG(1) << "Viewer " << viewer->getId() << " detached from " << sessionId;
  dropBridge(viewer);
}

int AdminRouter::getUpstreamFd(shared_ptr<PacketChannel> viewer) {
  lock_guard<mutex> guard(bridgesMutex);
  auto it = bridges.find(viewer);
  if (it == bridges.end() || it->second.remote) {
    return -1;
  }
  return it->second.upstreamFd;
}

bool AdminRouter::relayUpstream(shared_ptr<PacketChannel> viewer) {
  int fd = getUpstreamFd(viewer);
  if (fd < 0) {
    return false;
  }
  try {
    for (int i = 0; i < MAX_RELAY_BATCH && upstreamSocketHandler->hasData(fd);
         i++) {
      Packet packet;
      if (!upstreamSocketHandler->readPacket(fd, &packet)) {
        continue;
      }
      bool delivered = viewer->send(packet);
      if (packet.getHeader() == PacketType::CONNECTION_CLOSE) {
        // The supervisor refused the viewer; pass its reason on as is
        dropBridge(viewer);
        return false;
      }
      if (!delivered) {
        LOG(INFO) << "Viewer " << viewer->getId()
                  << " is gone, closing its supervisor connection";
        dropBridge(viewer);
        return false;
      }
    }
  } catch (const std::runtime_error& ex) {
    LOG(INFO) << "Supervisor connection of viewer " << viewer->getId()
              << " closed: " << ex.what();
    dropBridge(viewer);
    // Forces the viewer to reconnect and pick up a recovered session
    viewer->sendClose(CLOSE_UPSTREAM_CLOSED, "Supervisor connection closed");
    return false;
  }
  return true;
}

void AdminRouter::forward(shared_ptr<PacketChannel> viewer,
                          const Packet& packet) {
  Bridge bridge;
  {
    lock_guard<mutex> guard(bridgesMutex);
    auto it = bridges.find(viewer);
    if (it == bridges.end()) {
      VLOG(1) << "Dropping packet from unbridged viewer " << viewer->getId();
      return;
    }
    bridge = it->second;
  }

  if (!bridge.remote) {
    try {
      upstreamSocketHandler->writePacket(bridge.upstreamFd, packet);
    } catch (const std::runtime_error& ex) {
      // relayUpstream notices the closed connection and closes the viewer
      LOG(INFO) << "Could not forward to supervisor for " << bridge.sessionId
                << ": " << ex.what();
    }
    return;
  }

  if (packet.getHeader() == PacketType::HEARTBEAT) {
    viewer->send(packet);
    return;
  }
  WorkerInput input;
  input.set_session_id(bridge.sessionId);
  SequencedInput sequencedInput;
  OutputAck outputAck;
  ReplayRequest replayRequest;
  switch (packet.getHeader()) {
    case PacketType::SEQUENCED_INPUT:
      if (!sequencedInput.ParseFromString(packet.getPayload())) {
        VLOG(1) << "Dropping malformed input for " << bridge.sessionId;
        return;
      }
      *(input.mutable_sequenced_input()) = sequencedInput;
      break;
    case PacketType::OUTPUT_ACK:
      if (!outputAck.ParseFromString(packet.getPayload())) {
        VLOG(1) << "Dropping malformed ack for " << bridge.sessionId;
        return;
      }
      *(input.mutable_output_ack()) = outputAck;
      break;
    case PacketType::REPLAY_REQUEST:
      if (!replayRequest.ParseFromString(packet.getPayload())) {
        VLOG(1) << "Dropping malformed replay request for "
                << bridge.sessionId;
        return;
      }
      *(input.mutable_replay_request()) = replayRequest;
      break;
    default:
      VLOG(1) << "Dropping packet " << int(packet.getHeader())
              << " for worker-routed " << bridge.sessionId;
      return;
  }

  auto worker = workers->getWorker(bridge.workerId);
  if (!worker || !worker->channel->send(Packet::fromProto(
                     PacketType::WORKER_INPUT, input))) {
    LOG(WARNING) << "Worker " << bridge.workerId << " unreachable for "
                 << bridge.sessionId;
  }
}

bool AdminRouter::kill(const string& sessionId) {
  auto record = store->get(sessionId);
  if (record && record->workerId) {
    auto worker = workers->getWorker(*record->workerId);
    if (worker && !worker->channel->isDead()) {
      WorkerKillSession killSession;
      killSession.set_session_id(sessionId);
      worker->channel->send(
          Packet::fromProto(PacketType::WORKER_KILL_SESSION, killSession));
      LOG(INFO) << "Asked worker " << worker->id << " to kill " << sessionId;
      // The worker reports the end through WORKER_SESSION_ENDED
      return true;
    }
  }

  auto result = supervisorLink->killSession(sessionId);
  if (result == SupervisorLink::KillResult::KILLED) {
    LOG(INFO) << "Supervisor killed " << sessionId;
  }

  // The record must not stay running when the process could not be reached
  bool marked = false;
  string completedAt = nowIso8601();
  try {
    store->update(sessionId, [&](SessionRecord* r) {
      if (!isTerminalStatus(r->status)) {
        r->status = SessionStatus::KILLED;
        r->completedAt = completedAt;
        marked = true;
      }
    });
  } catch (const std::exception& ex) {
    STERROR << "Could not mark " << sessionId << " killed: " << ex.what();
  }
  if (marked) {
    LOG(INFO) << "Marked " << sessionId << " killed in the store";
  }
  return result == SupervisorLink::KillResult::KILLED || marked;
}

bool AdminRouter::multiplexerHasSession(const string& sessionId) {
  if (!multiplexer) {
    return false;
  }
  try {
    return multiplexer->isAvailable() && multiplexer->hasSession(sessionId);
  } catch (const std::exception& ex) {
    LOG(WARNING) << "Multiplexer check of " << sessionId
                 << " failed: " << ex.what();
    return false;
  }
}

int AdminRouter::cleanupOrphanedSessions() {
  vector<SessionRecord> running = store->listByStatus(SessionStatus::RUNNING);
  if (running.empty()) {
    return 0;
  }
  optional<set<string>> supervisorActive = supervisorLink->activeSessionIds();
  if (!supervisorActive) {
    LOG(WARNING) << "Supervisor unreachable, not judging " << running.size()
                 << " running sessions";
    return 0;
  }
  set<string> workerActive;
  for (const auto& worker : workers->listWorkers()) {
    if (!worker.channel->isDead()) {
      workerActive.insert(worker.activeSessions.begin(),
                          worker.activeSessions.end());
    }
  }

  int marked = 0;
  string completedAt = nowIso8601();
  for (const auto& record : running) {
    if (supervisorActive->count(record.id) || workerActive.count(record.id) ||
        multiplexerHasSession(record.id)) {
      continue;
    }
    bool changed = false;
    store->update(record.id, [&](SessionRecord* r) {
      if (r->status == SessionStatus::RUNNING) {
        r->status = SessionStatus::FAILED;
        r->completedAt = completedAt;
        changed = true;
      }
    });
    if (changed) {
      LOG(INFO) << "Marked orphaned session " << record.id << " failed";
      marked++;
    }
  }
  return marked;
}

set<shared_ptr<PacketChannel>> AdminRouter::getWorkerViewers(
    const string& sessionId) {
  lock_guard<mutex> guard(bridgesMutex);
  auto it = workerViewers.find(sessionId);
  if (it == workerViewers.end()) {
    return set<shared_ptr<PacketChannel>>();
  }
  return it->second;
}

void AdminRouter::handleWorkerOutput(const WorkerSessionOutput& output) {
  string serialized =
      Packet::fromProto(PacketType::SEQUENCED_OUTPUT, output.output())
          .serialize();
  for (auto& viewer : getWorkerViewers(output.session_id())) {
    if (!viewer->sendSerialized(serialized)) {
      VLOG(1) << "Worker-routed viewer " << viewer->getId() << " is gone";
      dropBridge(viewer);
    }
  }
}

void AdminRouter::handleWorkerSessionEnded(const WorkerSessionEnded& ended) {
  const string& sessionId = ended.session_id();
  SessionStatus status;
  try {
    status = sessionStatusFromString(ended.status());
  } catch (const std::runtime_error& ex) {
    LOG(WARNING) << "Worker reported " << sessionId
                 << " ended with an unknown status: " << ex.what();
    status = SessionStatus::FAILED;
  }
  if (!isTerminalStatus(status)) {
    status = SessionStatus::FAILED;
  }

  string completedAt = nowIso8601();
  try {
    store->update(sessionId, [&](SessionRecord* r) {
      if (isTerminalStatus(r->status)) {
        return;
      }
      r->status = status;
      r->exitCode = ended.exit_code();
      r->completedAt = completedAt;
      if (!ended.output_log().empty()) {
        r->outputLog = ended.output_log();
      }
    });
  } catch (const std::exception& ex) {
    STERROR << "Could not persist end of " << sessionId << ": " << ex.what();
  }
  LOG(INFO) << "Worker session " << sessionId << " ended with "
            << ended.exit_code() << " (" << sessionStatusToString(status)
            << ")";

  for (auto& viewer : getWorkerViewers(sessionId)) {
    sendExitNotice(viewer, ended.exit_code(), sessionStatusToString(status));
  }
}

size_t AdminRouter::workerViewerCount(const string& sessionId) {
  return getWorkerViewers(sessionId).size();
}
}  // namespace tether

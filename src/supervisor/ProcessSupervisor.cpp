#include "ProcessSupervisor.hpp"

#include "OutputHeuristics.hpp"
#include "RecoveryManager.hpp"

#define BUF_SIZE (16 * 1024)

namespace tether {
ProcessSupervisor::ProcessSupervisor(
    const SupervisorConfig& _config, shared_ptr<SessionStore> _store,
    shared_ptr<OutputLedger> _ledger,
    shared_ptr<ProcessFactory> _processFactory,
    shared_ptr<TerminalMultiplexer> _multiplexer)
    : config(_config),
      commandBuilder(_config),
      store(_store),
      ledger(_ledger),
      processFactory(_processFactory),
      multiplexer(_multiplexer),
      halt(false) {}

ProcessSupervisor::~ProcessSupervisor() { shutdown(); }

shared_ptr<ActiveSession> ProcessSupervisor::findSession(
    const string& sessionId) {
  lock_guard<mutex> guard(sessionsMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    return nullptr;
  }
  return it->second;
}

void ProcessSupervisor::spawn(const SpawnRequest& request) {
  const string& sessionId = request.sessionId;
  if (halt) {
    throw std::runtime_error("Supervisor is shutting down");
  }
  {
    lock_guard<mutex> guard(sessionsMutex);
    if (sessions.find(sessionId) != sessions.end() ||
        spawning.find(sessionId) != spawning.end()) {
      throw SpawnConflict(sessionId);
    }
    spawning.insert(sessionId);
  }

  CommandSelection selection = commandBuilder.build(request);
  bool useMultiplexer = multiplexer && multiplexer->isAvailable();
  LOG(INFO) << "Spawning session " << sessionId << ": profile="
            << permissionProfileToString(request.permissionProfile)
            << ", cwd=" << request.cwd << ", multiplexer=" << useMultiplexer;

  shared_ptr<SessionProcess> process;
  optional<string> multiplexName;
  try {
    LaunchSpec processLaunch = selection.launch;
    if (useMultiplexer) {
      multiplexer->createSession(sessionId, selection.launch);
      multiplexName = multiplexer->nameFor(sessionId);
      processLaunch = multiplexer->attachCommand(
          sessionId, selection.launch.cols, selection.launch.rows);
    }
    process = processFactory->create();
    process->start(processLaunch);
  } catch (const std::exception& ex) {
    LOG(ERROR) << "Failed to spawn " << sessionId << ": " << ex.what();
    if (multiplexName) {
      try {
        multiplexer->killSession(sessionId);
      } catch (const std::exception& kex) {
        LOG(WARNING) << "Could not remove multiplexed session of "
                     << sessionId << ": " << kex.what();
      }
    }
    lock_guard<mutex> guard(sessionsMutex);
    spawning.erase(sessionId);
    throw;
  }

  auto session = make_shared<ActiveSession>(sessionId, process, config);
  auto now = Clock::now();
  session->profile = request.permissionProfile;
  session->multiplexName = multiplexName;
  if (request.permissionProfile != PermissionProfile::PLAIN) {
    session->healthDeadline =
        now + std::chrono::milliseconds(config.healthCheckDelayMs);
  }
  if (selection.sendPromptAfterSpawn) {
    session->pendingPrompt = request.prompt;
    session->promptDeadline =
        now + std::chrono::milliseconds(config.promptSendTimeoutMs);
  }
  // A fresh process starts its sequence over
  ledger->clearSession(sessionId);

  {
    lock_guard<mutex> guard(sessionsMutex);
    sessions[sessionId] = session;
    spawning.erase(sessionId);
    auto pendingIt = pendingViewers.find(sessionId);
    if (pendingIt != pendingViewers.end()) {
      lock_guard<mutex> handleGuard(session->handleMutex);
      for (auto& viewer : pendingIt->second) {
        if (!viewer->isDead()) {
          session->viewers.insert(viewer);
        }
      }
      VLOG(1) << "Attached " << session->viewers.size()
              << " parked viewers to " << sessionId;
      pendingViewers.erase(pendingIt);
    }
  }

  string startedAt = nowIso8601();
  pid_t pid = process->getPid();
  auto fill = [&](SessionRecord* r) {
    r->status = SessionStatus::RUNNING;
    r->permissionProfile = request.permissionProfile;
    r->processId = pid;
    r->startedAt = startedAt;
    r->completedAt = nullopt;
    r->exitCode = nullopt;
    r->outputLog.clear();
    r->outputBytes = 0;
    r->lastOutputSeq = 0;
    r->lastInputSeq = 0;
    r->multiplexName = multiplexName;
    if (!request.parentSessionId.empty()) {
      r->parentSessionId = request.parentSessionId;
    }
  };
  try {
    if (!store->update(sessionId, fill)) {
      SessionRecord record;
      record.id = sessionId;
      fill(&record);
      store->put(record);
    }
  } catch (const std::exception& ex) {
    STERROR << "Could not persist spawn of " << sessionId << ": "
            << ex.what();
  }

  startSessionThread(session);
}

void ProcessSupervisor::reattach(const SessionRecord& record,
                                 const LaunchSpec& attachLaunch,
                                 const string& seedOutput,
                                 bool waitingForInput) {
  const string& sessionId = record.id;
  {
    lock_guard<mutex> guard(sessionsMutex);
    if (sessions.find(sessionId) != sessions.end() ||
        spawning.find(sessionId) != spawning.end()) {
      throw SpawnConflict(sessionId);
    }
    spawning.insert(sessionId);
  }

  auto process = processFactory->create();
  try {
    process->start(attachLaunch);
  } catch (const std::exception&) {
    lock_guard<mutex> guard(sessionsMutex);
    spawning.erase(sessionId);
    throw;
  }

  auto session = make_shared<ActiveSession>(sessionId, process, config);
  auto now = Clock::now();
  session->profile = record.permissionProfile;
  session->multiplexName = record.multiplexName;
  if (!session->multiplexName && multiplexer) {
    session->multiplexName = multiplexer->nameFor(sessionId);
  }
  appendOutputLocked(session.get(), seedOutput);
  session->totalBytes = max<int64_t>(record.outputBytes, seedOutput.size());
  // Entries still in the ledger may be newer than the last flush
  session->outputSeq = max(record.lastOutputSeq, ledger->lastSeq(sessionId));
  session->lastAckedInputSeq = record.lastInputSeq;
  session->hasStarted = !seedOutput.empty();
  session->detector.seed(waitingForInput, now);
  session->detector.suppressClearUntil(
      now + std::chrono::milliseconds(config.recoveryGraceMs));

  {
    lock_guard<mutex> guard(sessionsMutex);
    sessions[sessionId] = session;
    spawning.erase(sessionId);
  }

  pid_t pid = process->getPid();
  optional<string> multiplexName = session->multiplexName;
  try {
    store->update(sessionId, [&](SessionRecord* r) {
      r->status = SessionStatus::RUNNING;
      r->completedAt = nullopt;
      r->exitCode = nullopt;
      r->processId = pid;
      r->multiplexName = multiplexName;
    });
  } catch (const std::exception& ex) {
    STERROR << "Could not persist recovery of " << sessionId << ": "
            << ex.what();
  }

  startSessionThread(session);
}

void ProcessSupervisor::startSessionThread(shared_ptr<ActiveSession> session) {
  vector<SessionThread> finished;
  lock_guard<mutex> guard(threadsMutex);
  for (auto it = sessionThreads.begin(); it != sessionThreads.end();) {
    if (*(it->done)) {
      finished.push_back(*it);
      it = sessionThreads.erase(it);
    } else {
      ++it;
    }
  }
  for (auto& sessionThread : finished) {
    sessionThread.t->join();
  }

  SessionThread sessionThread;
  sessionThread.done.reset(new std::atomic<bool>(false));
  auto done = sessionThread.done;
  sessionThread.t.reset(new thread([this, session, done]() {
    runSession(session);
    *done = true;
  }));
  sessionThreads.push_back(sessionThread);
}

void ProcessSupervisor::runSession(shared_ptr<ActiveSession> session) {
  el::Helpers::setThreadName(session->id);
  int fd = session->process->getFd();
  char b[BUF_SIZE];
  bool exited = false;

  while (!halt) {
    {
      lock_guard<mutex> guard(session->handleMutex);
      if (session->status != SessionStatus::RUNNING) {
        break;
      }
    }

    fd_set rfd;
    timeval tv;
    FD_ZERO(&rfd);
    FD_SET(fd, &rfd);
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(fd + 1, &rfd, NULL, NULL, &tv);
    if (numFdsSet < 0 && errno != EINTR) {
      STERROR << "select failed for " << session->id << ": "
              << strerror(errno);
      exited = true;
      break;
    }

    if (numFdsSet > 0 && FD_ISSET(fd, &rfd)) {
      ssize_t rc = ::read(fd, b, BUF_SIZE);
      if (rc > 0) {
        VLOG(3) << "Read " << rc << " bytes from " << session->id;
        handleOutput(session, string(b, rc));
      } else if (rc == 0 || (errno != EAGAIN && errno != EINTR)) {
        // EIO on the pty master means the child is gone
        exited = true;
        break;
      }
    }

    handleTick(session);
  }

  int exitCode = session->process->waitForExit();
  // The handle leaves RUNNING before the fd is closed so late input is
  // refused by the status check
  if (exited && !halt) {
    if (session->multiplexName && multiplexer) {
      // The attach client exits 0 whatever the command did
      try {
        optional<int> commandExitCode = multiplexer->reapSession(session->id);
        if (commandExitCode) {
          exitCode = *commandExitCode;
        }
      } catch (const std::exception& ex) {
        LOG(WARNING) << "Could not reap multiplexed session of " << session->id
                     << ": " << ex.what();
      }
    }
    handleExit(session, exitCode);
  } else {
    VLOG(1) << "Session thread for " << session->id << " stopped";
  }
  session->process->cleanup();
}

void ProcessSupervisor::appendOutputLocked(ActiveSession* session,
                                           const string& data) {
  session->outputBuffer.append(data);
  session->totalBytes += data.size();
  if (int64_t(session->outputBuffer.size()) > config.maxOutputLog) {
    session->outputBuffer.erase(
        0, session->outputBuffer.size() - config.maxOutputLog);
  }
}

void ProcessSupervisor::emitLocked(ActiveSession* session,
                                   const OutputContent& content) {
  session->outputSeq++;
  SequencedOutput sequencedOutput;
  sequencedOutput.set_session_id(session->id);
  sequencedOutput.set_seq(session->outputSeq);
  *(sequencedOutput.mutable_content()) = content;
  sequencedOutput.set_timestamp(nowIso8601());
  string serialized =
      Packet::fromProto(PacketType::SEQUENCED_OUTPUT, sequencedOutput)
          .serialize();

  ledger->append(session->id, session->outputSeq, content.kind(), serialized);

  for (auto it = session->viewers.begin(); it != session->viewers.end();) {
    if (!(*it)->sendSerialized(serialized)) {
      VLOG(1) << "Dropping viewer " << (*it)->getId() << " of "
              << session->id;
      it = session->viewers.erase(it);
    } else {
      ++it;
    }
  }
}

void ProcessSupervisor::handleOutput(shared_ptr<ActiveSession> session,
                                     const string& data) {
  lock_guard<mutex> guard(session->handleMutex);
  if (session->status != SessionStatus::RUNNING) {
    return;
  }
  auto now = Clock::now();
  appendOutputLocked(session.get(), data);
  session->hasStarted = true;
  optional<bool> waitingChange = session->detector.onOutput(data, now);

  OutputContent content;
  content.set_kind(OutputContent::OUTPUT);
  content.set_data(data);
  emitLocked(session.get(), content);

  if (waitingChange) {
    OutputContent waitingContent;
    waitingContent.set_kind(OutputContent::WAITING_STATE);
    waitingContent.set_waiting(*waitingChange);
    emitLocked(session.get(), waitingContent);
  }

  if (session->pendingPrompt && !session->promptReadyAt) {
    session->promptProbe.append(data);
    if (looksReadyForPrompt(session->promptProbe)) {
      session->promptReadyAt =
          now + std::chrono::milliseconds(config.promptSettleMs);
    }
  }
}

void ProcessSupervisor::handleTick(shared_ptr<ActiveSession> session) {
  optional<string> promptToSend;
  optional<SessionRecord> snapshot;
  bool unhealthy = false;
  {
    lock_guard<mutex> guard(session->handleMutex);
    if (session->status != SessionStatus::RUNNING) {
      return;
    }
    auto now = Clock::now();
    if (session->pendingPrompt &&
        ((session->promptReadyAt && now >= *session->promptReadyAt) ||
         now >= session->promptDeadline)) {
      promptToSend = *session->pendingPrompt;
      session->pendingPrompt.reset();
      session->promptProbe.clear();
    }
    if (session->healthDeadline && now >= *session->healthDeadline) {
      session->healthDeadline.reset();
      unhealthy = !isStartupHealthy(session->outputBuffer,
                                    config.healthVisibleThreshold);
    }
    if (now - session->lastFlush >=
        std::chrono::milliseconds(config.flushIntervalMs)) {
      session->lastFlush = now;
      snapshot = snapshotLocked(session.get());
    }
  }

  if (promptToSend) {
    LOG(INFO) << "Sending initial prompt to " << session->id;
    session->process->write(*promptToSend + "\r");
  }
  if (snapshot) {
    persistSnapshot(*snapshot, false);
  }
  if (unhealthy) {
    StartupHealthFailure failure(session->id);
    LOG(ERROR) << failure.what() << ", killing it";
    terminateSession(session, SessionStatus::FAILED);
  }
}

void ProcessSupervisor::handleExit(shared_ptr<ActiveSession> session,
                                   int exitCode) {
  SessionRecord snapshot;
  {
    lock_guard<mutex> guard(session->handleMutex);
    if (session->status != SessionStatus::RUNNING) {
      // Already ended by kill
      return;
    }
    session->status =
        exitCode == 0 ? SessionStatus::COMPLETED : SessionStatus::FAILED;
    OutputContent content;
    content.set_kind(OutputContent::EXIT);
    content.set_exit_code(exitCode);
    content.set_status(sessionStatusToString(session->status));
    emitLocked(session.get(), content);
    snapshot = snapshotLocked(session.get());
    snapshot.exitCode = exitCode;
  }
  LOG(INFO) << "Session " << session->id << " exited with " << exitCode;
  removeSession(session);
  persistSnapshot(snapshot, true);
}

bool ProcessSupervisor::terminateSession(shared_ptr<ActiveSession> session,
                                         SessionStatus finalStatus) {
  SessionRecord snapshot;
  {
    lock_guard<mutex> guard(session->handleMutex);
    if (session->status != SessionStatus::RUNNING) {
      return false;
    }
    session->status = finalStatus;
    OutputContent content;
    content.set_kind(OutputContent::EXIT);
    content.set_exit_code(-1);
    content.set_status(sessionStatusToString(finalStatus));
    emitLocked(session.get(), content);
    snapshot = snapshotLocked(session.get());
    if (finalStatus == SessionStatus::FAILED) {
      snapshot.exitCode = -1;
    }
  }
  removeSession(session);
  persistSnapshot(snapshot, true);

  session->process->terminate();
  if (session->multiplexName && multiplexer) {
    try {
      multiplexer->killSession(session->id);
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Could not kill multiplexed session of " << session->id
                   << ": " << ex.what();
    }
  }
  return true;
}

bool ProcessSupervisor::kill(const string& sessionId) {
  auto session = findSession(sessionId);
  if (!session) {
    VLOG(1) << "Kill of inactive session " << sessionId;
    return false;
  }
  bool killed = terminateSession(session, SessionStatus::KILLED);
  if (killed) {
    LOG(INFO) << "Killed session " << sessionId;
  }
  return killed;
}

void ProcessSupervisor::resize(const string& sessionId, int cols, int rows) {
  auto session = findSession(sessionId);
  if (!session) {
    return;
  }
  {
    lock_guard<mutex> guard(session->handleMutex);
    if (session->status != SessionStatus::RUNNING) {
      return;
    }
  }
  session->process->resize(cols, rows);
}

void ProcessSupervisor::write(const string& sessionId, const string& data) {
  auto session = findSession(sessionId);
  if (!session) {
    return;
  }
  {
    lock_guard<mutex> guard(session->handleMutex);
    if (session->status != SessionStatus::RUNNING) {
      return;
    }
  }
  session->process->write(data);
}

SessionRecord ProcessSupervisor::snapshotLocked(ActiveSession* session) {
  SessionRecord snapshot;
  snapshot.id = session->id;
  snapshot.status = session->status;
  snapshot.outputLog = session->outputBuffer;
  snapshot.outputBytes = session->totalBytes;
  snapshot.lastOutputSeq = session->outputSeq;
  snapshot.lastInputSeq = session->lastAckedInputSeq;
  return snapshot;
}

void ProcessSupervisor::persistSnapshot(const SessionRecord& snapshot,
                                        bool final) {
  string completedAt = nowIso8601();
  try {
    store->update(snapshot.id, [&](SessionRecord* r) {
      r->outputLog = snapshot.outputLog;
      r->outputBytes = snapshot.outputBytes;
      r->lastOutputSeq = snapshot.lastOutputSeq;
      r->lastInputSeq = snapshot.lastInputSeq;
      if (!final) {
        return;
      }
      if (isTerminalStatus(r->status) && r->status != snapshot.status) {
        LOG(WARNING) << "Record of " << snapshot.id << " is already "
                     << sessionStatusToString(r->status) << ", not marking it "
                     << sessionStatusToString(snapshot.status);
        return;
      }
      r->status = snapshot.status;
      r->exitCode = snapshot.exitCode;
      r->completedAt = completedAt;
    });
  } catch (const std::exception& ex) {
    STERROR << "Could not persist output of " << snapshot.id << ": "
            << ex.what();
  }
}

void ProcessSupervisor::removeSession(shared_ptr<ActiveSession> session) {
  lock_guard<mutex> guard(sessionsMutex);
  auto it = sessions.find(session->id);
  if (it != sessions.end() && it->second == session) {
    sessions.erase(it);
  }
}

void ProcessSupervisor::sendHistory(shared_ptr<PacketChannel> viewer,
                                    const string& data,
                                    int64_t lastInputAckSeq, bool waiting,
                                    int64_t lastOutputSeq) {
  History history;
  history.set_data(data);
  history.set_last_input_ack_seq(lastInputAckSeq);
  history.set_waiting_for_input(waiting);
  history.set_last_output_seq(lastOutputSeq);
  viewer->send(Packet::fromProto(PacketType::HISTORY, history));
}

void ProcessSupervisor::sendExitNotice(shared_ptr<PacketChannel> viewer,
                                       int exitCode, SessionStatus status) {
  ExitNotice notice;
  notice.set_exit_code(exitCode);
  notice.set_status(sessionStatusToString(status));
  viewer->send(Packet::fromProto(PacketType::EXIT_NOTICE, notice));
}

ProcessSupervisor::AttachResult ProcessSupervisor::attachViewer(
    const string& sessionId, shared_ptr<PacketChannel> viewer) {
  auto attachToHandle = [&](shared_ptr<ActiveSession> session) {
    lock_guard<mutex> guard(session->handleMutex);
    if (session->status != SessionStatus::RUNNING) {
      return false;
    }
    // History and registration happen under one lock so no output can slip
    // between them
    sendHistory(viewer, session->outputBuffer, session->lastAckedInputSeq,
                session->detector.isWaiting(), session->outputSeq);
    session->viewers.insert(viewer);
    return true;
  };

  auto session = findSession(sessionId);
  if (session && attachToHandle(session)) {
    LOG(INFO) << "Viewer " << viewer->getId() << " attached to " << sessionId;
    return AttachResult::ATTACHED;
  }

  auto record = store->get(sessionId);
  if (!record) {
    return AttachResult::NOT_FOUND;
  }

  if (record->status == SessionStatus::PENDING) {
    {
      lock_guard<mutex> guard(sessionsMutex);
      if (sessions.find(sessionId) == sessions.end()) {
        sendHistory(viewer, "", 0, false, 0);
        pendingViewers[sessionId].insert(viewer);
        VLOG(1) << "Viewer " << viewer->getId() << " parked on pending "
                << sessionId;
        return AttachResult::PENDING;
      }
    }
    // The spawn finished while we were looking
    session = findSession(sessionId);
    if (session && attachToHandle(session)) {
      return AttachResult::ATTACHED;
    }
    record = store->get(sessionId);
    if (!record) {
      return AttachResult::NOT_FOUND;
    }
  }

  if (record->status == SessionStatus::RUNNING && recoveryManager) {
    auto outcome = recoveryManager->tryRecover(*record);
    if (outcome == RecoveryManager::Outcome::UNREACHABLE) {
      LOG(INFO) << "Multiplexer busy, viewer " << viewer->getId()
                << " of " << sessionId << " should retry";
      return AttachResult::RETRY;
    }
    if (outcome == RecoveryManager::Outcome::RECOVERED) {
      session = findSession(sessionId);
      if (session && attachToHandle(session)) {
        LOG(INFO) << "Viewer " << viewer->getId()
                  << " attached to recovered " << sessionId;
        return AttachResult::ATTACHED;
      }
      record = store->get(sessionId);
      if (!record) {
        return AttachResult::NOT_FOUND;
      }
    }
  }

  if (record->status == SessionStatus::RUNNING) {
    LOG(INFO) << "Session " << sessionId
              << " is running in the store but cannot be reached, marking it "
                 "failed";
    string completedAt = nowIso8601();
    try {
      store->update(sessionId, [&](SessionRecord* r) {
        if (r->status == SessionStatus::RUNNING) {
          r->status = SessionStatus::FAILED;
          r->completedAt = completedAt;
        }
      });
    } catch (const std::exception& ex) {
      STERROR << "Could not mark " << sessionId << " stale: " << ex.what();
    }
    sendHistory(viewer, record->outputLog, record->lastInputSeq, false,
                record->lastOutputSeq);
    sendExitNotice(viewer, -1, SessionStatus::FAILED);
    return AttachResult::ENDED;
  }

  sendHistory(viewer, record->outputLog, record->lastInputSeq, false,
              record->lastOutputSeq);
  sendExitNotice(viewer, record->exitCode.value_or(-1), record->status);
  return AttachResult::ENDED;
}

void ProcessSupervisor::detachViewer(const string& sessionId,
                                     shared_ptr<PacketChannel> viewer) {
  auto session = findSession(sessionId);
  if (session) {
    lock_guard<mutex> guard(session->handleMutex);
    session->viewers.erase(viewer);
  }
  lock_guard<mutex> guard(sessionsMutex);
  auto it = pendingViewers.find(sessionId);
  if (it != pendingViewers.end()) {
    it->second.erase(viewer);
    if (it->second.empty()) {
      pendingViewers.erase(it);
    }
  }
}

void ProcessSupervisor::failPendingViewers(const string& sessionId) {
  set<shared_ptr<PacketChannel>> parked;
  {
    lock_guard<mutex> guard(sessionsMutex);
    auto it = pendingViewers.find(sessionId);
    if (it == pendingViewers.end()) {
      return;
    }
    parked = it->second;
    pendingViewers.erase(it);
  }
  for (auto& viewer : parked) {
    sendExitNotice(viewer, -1, SessionStatus::FAILED);
  }
}

void ProcessSupervisor::handleViewerPacket(const string& sessionId,
                                           shared_ptr<PacketChannel> viewer,
                                           const Packet& packet) {
  switch (packet.getHeader()) {
    case PacketType::SEQUENCED_INPUT: {
      SequencedInput input;
      if (!input.ParseFromString(packet.getPayload())) {
        LOG(WARNING) << "Dropping malformed input from viewer "
                     << viewer->getId() << " of " << sessionId;
        break;
      }
      auto session = findSession(sessionId);
      if (!session) {
        VLOG(1) << "Input for inactive session " << sessionId;
        break;
      }
      bool fresh = false;
      {
        lock_guard<mutex> guard(session->handleMutex);
        if (input.seq() > session->lastAckedInputSeq) {
          session->lastAckedInputSeq = input.seq();
          fresh = true;
        }
      }
      if (fresh) {
        const InputContent& content = input.content();
        switch (content.kind()) {
          case InputContent::WRITE:
            if (!content.data().empty()) {
              write(sessionId, content.data());
            }
            break;
          case InputContent::RESIZE:
            if (content.cols() > 0 && content.rows() > 0) {
              resize(sessionId, content.cols(), content.rows());
            }
            break;
          case InputContent::KILL:
            kill(sessionId);
            break;
        }
      } else {
        VLOG(1) << "Duplicate input " << input.seq() << " for " << sessionId;
      }
      // Acknowledge duplicates too so the sender stops retransmitting
      InputAck ack;
      ack.set_session_id(sessionId);
      ack.set_ack_seq(input.seq());
      viewer->send(Packet::fromProto(PacketType::INPUT_ACK, ack));
      break;
    }
    case PacketType::OUTPUT_ACK: {
      OutputAck ack;
      if (!ack.ParseFromString(packet.getPayload())) {
        LOG(WARNING) << "Dropping malformed output ack from viewer "
                     << viewer->getId() << " of " << sessionId;
        break;
      }
      ledger->ack(sessionId, ack.ack_seq());
      break;
    }
    case PacketType::REPLAY_REQUEST: {
      ReplayRequest request;
      if (!request.ParseFromString(packet.getPayload())) {
        LOG(WARNING) << "Dropping malformed replay request from viewer "
                     << viewer->getId() << " of " << sessionId;
        break;
      }
      for (const auto& entry : ledger->replay(sessionId, request.from_seq())) {
        if (!viewer->sendSerialized(entry.packet)) {
          break;
        }
      }
      break;
    }
    case PacketType::HEARTBEAT: {
      viewer->send(Packet(uint8_t(PacketType::HEARTBEAT), ""));
      break;
    }
    default:
      LOG(WARNING) << "Unexpected packet from viewer of " << sessionId << ": "
                   << int(packet.getHeader());
  }
}

optional<SessionStatusInfo> ProcessSupervisor::status(const string& sessionId) {
  auto session = findSession(sessionId);
  if (session) {
    lock_guard<mutex> guard(session->handleMutex);
    SessionStatusInfo info;
    info.status = session->status;
    info.active = true;
    info.outputSeq = session->outputSeq;
    info.totalBytes = session->totalBytes;
    info.waitingForInput = session->detector.isWaiting();
    info.started = session->hasStarted;
    return info;
  }
  auto record = store->get(sessionId);
  if (!record) {
    return nullopt;
  }
  SessionStatusInfo info;
  info.status = record->status;
  info.active = false;
  info.outputSeq = record->lastOutputSeq;
  info.totalBytes = record->outputBytes;
  info.waitingForInput = false;
  info.started = record->outputBytes > 0;
  return info;
}

bool ProcessSupervisor::isActive(const string& sessionId) {
  return findSession(sessionId) != nullptr;
}

vector<string> ProcessSupervisor::activeSessionIds() {
  lock_guard<mutex> guard(sessionsMutex);
  vector<string> ids;
  for (const auto& it : sessions) {
    ids.push_back(it.first);
  }
  return ids;
}

map<string, bool> ProcessSupervisor::waitingStates() {
  vector<shared_ptr<ActiveSession>> active;
  {
    lock_guard<mutex> guard(sessionsMutex);
    for (const auto& it : sessions) {
      active.push_back(it.second);
    }
  }
  map<string, bool> states;
  for (auto& session : active) {
    lock_guard<mutex> guard(session->handleMutex);
    states[session->id] = session->detector.isWaiting();
  }
  return states;
}

void ProcessSupervisor::flushAll() {
  vector<shared_ptr<ActiveSession>> active;
  {
    lock_guard<mutex> guard(sessionsMutex);
    for (const auto& it : sessions) {
      active.push_back(it.second);
    }
  }
  for (auto& session : active) {
    SessionRecord snapshot;
    {
      lock_guard<mutex> guard(session->handleMutex);
      session->lastFlush = Clock::now();
      snapshot = snapshotLocked(session.get());
    }
    persistSnapshot(snapshot, false);
  }
}

void ProcessSupervisor::shutdown() {
  if (halt.exchange(true)) {
    return;
  }
  LOG(INFO) << "Shutting down supervisor";

  vector<shared_ptr<ActiveSession>> active;
  {
    lock_guard<mutex> guard(sessionsMutex);
    for (const auto& it : sessions) {
      active.push_back(it.second);
    }
  }

  for (auto& session : active) {
    bool preserved = false;
    if (session->multiplexName && multiplexer) {
      try {
        if (multiplexer->hasSession(session->id)) {
          multiplexer->detachClients(session->id);
          preserved = true;
        }
      } catch (const std::exception& ex) {
        LOG(WARNING) << "Could not detach " << session->id << ": "
                     << ex.what();
      }
    }

    SessionRecord snapshot;
    {
      lock_guard<mutex> guard(session->handleMutex);
      if (!preserved && session->status == SessionStatus::RUNNING) {
        session->status = SessionStatus::KILLED;
      }
      snapshot = snapshotLocked(session.get());
    }
    if (preserved) {
      LOG(INFO) << "Detaching multiplexed session " << session->id
                << " (preserved)";
      persistSnapshot(snapshot, false);
    } else {
      LOG(INFO) << "Killing session " << session->id;
      persistSnapshot(snapshot, true);
    }
    session->process->terminate();
  }

  vector<SessionThread> threads;
  {
    lock_guard<mutex> guard(threadsMutex);
    threads = sessionThreads;
    sessionThreads.clear();
  }
  for (auto& sessionThread : threads) {
    if (sessionThread.t->joinable()) {
      sessionThread.t->join();
    }
  }

  lock_guard<mutex> guard(sessionsMutex);
  sessions.clear();
  pendingViewers.clear();
}
}  // namespace tether

#include "SupervisorServer.hpp"

namespace tether {
namespace {
const int64_t LEDGER_PRUNE_INTERVAL_MS = 10 * 1000;
const int64_t CLOSE_LINGER_MS = 1000;
}  // namespace

SupervisorServer::SupervisorServer(shared_ptr<SocketHandler> _socketHandler,
                                   const SocketEndpoint& _endpoint,
                                   shared_ptr<ProcessSupervisor> _supervisor,
                                   const SupervisorConfig& _config)
    : socketHandler(_socketHandler),
      endpoint(_endpoint),
      supervisor(_supervisor),
      config(_config),
      halt(false) {}

SupervisorServer::~SupervisorServer() {
  halt = true;
  joinFinishedThreads(true);
}

void SupervisorServer::run() {
  set<int> serverFds = socketHandler->listen(endpoint);
  LOG(INFO) << "Listening for viewers on " << endpoint.name();
  auto lastPrune = Clock::now();

  while (!halt) {
    fd_set rfds;
    FD_ZERO(&rfds);
    int maxFd = 0;
    for (int i : serverFds) {
      FD_SET(i, &rfds);
      maxFd = max(maxFd, i);
    }
    timeval tv;
    tv.tv_sec = 0;
    tv.tv_usec = 10000;
    int numFdsSet = select(maxFd + 1, &rfds, NULL, NULL, &tv);
    if (numFdsSet < 0 && GetErrno() != EINTR) {
      FATAL_FAIL(numFdsSet);
    }

    if (numFdsSet > 0) {
      for (int i : serverFds) {
        if (!FD_ISSET(i, &rfds)) {
          continue;
        }
        int clientFd = socketHandler->accept(i);
        if (clientFd < 0) {
          continue;
        }
        VLOG(1) << "New viewer connection on fd " << clientFd;
        lock_guard<mutex> guard(viewerThreadMutex);
        ViewerThread viewerThread;
        viewerThread.done.reset(new std::atomic<bool>(false));
        auto done = viewerThread.done;
        viewerThread.t.reset(new thread([this, clientFd, done]() {
          handleViewer(clientFd);
          *done = true;
        }));
        viewerThreads.push_back(viewerThread);
      }
    }

    if (millisSince(lastPrune) >= LEDGER_PRUNE_INTERVAL_MS) {
      lastPrune = Clock::now();
      supervisor->getLedger()->prune();
      joinFinishedThreads(false);
    }
  }

  socketHandler->stopListening(endpoint);
  joinFinishedThreads(true);
  LOG(INFO) << "Viewer server stopped";
}

void SupervisorServer::joinFinishedThreads(bool all) {
  vector<ViewerThread> toJoin;
  {
    lock_guard<mutex> guard(viewerThreadMutex);
    for (auto it = viewerThreads.begin(); it != viewerThreads.end();) {
      if (all || *(it->done)) {
        toJoin.push_back(*it);
        it = viewerThreads.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& viewerThread : toJoin) {
    if (viewerThread.t->joinable()) {
      viewerThread.t->join();
    }
  }
}

void SupervisorServer::handleViewer(int fd) {
  auto channel = make_shared<PacketChannel>(socketHandler, fd,
                                            config.viewerBufferBytes);
  el::Helpers::setThreadName("viewer-" + channel->getId().substr(0, 8));
  string sessionId;
  bool attached = false;

  try {
    Packet packet;
    bool gotPacket = socketHandler->readPacket(fd, &packet);
    if (gotPacket && packet.getHeader() == PacketType::VIEWER_ATTACH) {
      sessionId = stringToProto<ViewerAttach>(packet.getPayload()).session_id();
    }
    if (sessionId.empty()) {
      LOG(WARNING) << "Viewer " << channel->getId()
                   << " connected without a session id";
      channel->sendClose(CLOSE_MISSING_SESSION_ID, "Missing session id");
      channel->drain(CLOSE_LINGER_MS);
    } else {
      auto result = supervisor->attachViewer(sessionId, channel);
      if (result == ProcessSupervisor::AttachResult::NOT_FOUND) {
        LOG(INFO) << "Viewer asked for unknown session " << sessionId;
        channel->sendClose(CLOSE_SESSION_NOT_FOUND, "Session not found");
        channel->drain(CLOSE_LINGER_MS);
      } else if (result == ProcessSupervisor::AttachResult::RETRY) {
        channel->sendClose(CLOSE_SUPERVISOR_UNREACHABLE,
                           "Session not reachable, retry");
        channel->drain(CLOSE_LINGER_MS);
      } else {
        attached = true;
      }
    }

    while (attached && !halt && !channel->isDead()) {
      if (socketHandler->waitForData(fd, 10)) {
        if (socketHandler->readPacket(fd, &packet)) {
          if (packet.getHeader() == PacketType::CONNECTION_CLOSE) {
            VLOG(1) << "Viewer " << channel->getId() << " closed";
            break;
          }
          supervisor->handleViewerPacket(sessionId, channel, packet);
        }
      }
      channel->flush();
    }
    channel->drain(CLOSE_LINGER_MS);
  } catch (const std::runtime_error& ex) {
    LOG(INFO) << "Viewer " << channel->getId() << " of "
              << (sessionId.empty() ? "<none>" : sessionId)
              << " disconnected: " << ex.what();
  }

  if (attached) {
    supervisor->detachViewer(sessionId, channel);
  }
  channel->markDead();
  socketHandler->close(fd);
}
}  // namespace tether

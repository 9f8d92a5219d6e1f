#include "RouterServer.hpp"

namespace tether {
namespace {
const int64_t CLOSE_LINGER_MS = 1000;
}  // namespace

RouterServer::RouterServer(shared_ptr<SocketHandler> _socketHandler,
                           const SocketEndpoint& _viewerEndpoint,
                           const SocketEndpoint& _workerEndpoint,
                           shared_ptr<AdminRouter> _router,
                           shared_ptr<WorkerRegistry> _workers,
                           const RouterOptions& _options)
    : socketHandler(_socketHandler),
      viewerEndpoint(_viewerEndpoint),
      workerEndpoint(_workerEndpoint),
      router(_router),
      workers(_workers),
      options(_options),
      halt(false) {
  httpServer.Post(R"(/kill/([^/]+))", [this](const httplib::Request& req,
                                              httplib::Response& res) {
    bool ok = router->kill(req.matches[1].str());
    res.set_content(json{{"ok", ok}}.dump(), "application/json");
  });
  httpServer.Get("/workers", [this](const httplib::Request&,
                                    httplib::Response& res) {
    res.set_content(workersToJson().dump(), "application/json");
  });
  httpServer.Get("/health", [this](const httplib::Request&,
                                   httplib::Response& res) {
    res.set_content(
        json{{"ok", !halt}, {"workers", workers->listWorkers().size()}}.dump(),
        "application/json");
  });
  httpServer.Post("/cleanup", [this](const httplib::Request&,
                                     httplib::Response& res) {
    int marked = router->cleanupOrphanedSessions();
    res.set_content(json{{"ok", true}, {"marked", marked}}.dump(),
                    "application/json");
  });
}

RouterServer::~RouterServer() {
  halt = true;
  stopHttpApi();
  joinFinishedThreads(true);
}

void RouterServer::startHttpApi(const string& host, int port) {
  if (!httpServer.bind_to_port(host.c_str(), port)) {
    throw std::runtime_error("Could not bind router API to " + host + ":" +
                             to_string(port));
  }
  LOG(INFO) << "Router API listening on " << host << ":" << port;
  httpThread.reset(new thread([this]() {
    el::Helpers::setThreadName("http-api");
    httpServer.listen_after_bind();
  }));
}

void RouterServer::stopHttpApi() {
  httpServer.stop();
  if (httpThread && httpThread->joinable()) {
    httpThread->join();
  }
  httpThread.reset();
}

json RouterServer::workersToJson() {
  json result = json::array();
  for (const auto& worker : workers->listWorkers()) {
    result.push_back(json{{"id", worker.id},
                          {"name", worker.name},
                          {"hostname", worker.hostname},
                          {"maxSessions", worker.maxSessions},
                          {"activeSessions", worker.activeSessions},
                          {"live", !worker.channel->isDead()},
                          {"lastSeenMs", millisSince(worker.lastSeen)}});
  }
  return result;
}

void RouterServer::run() {
  set<int> viewerFds = socketHandler->listen(viewerEndpoint);
  set<int> workerFds = socketHandler->listen(workerEndpoint);
  LOG(INFO) << "Listening for viewers on " << viewerEndpoint.name()
            << " and workers on " << workerEndpoint.name();
  auto lastCleanup = Clock::now();
  auto lastPrune = Clock::now();

  while (!halt) {
    fd_set rfds;
    FD_ZERO(&rfds);
    int maxFd = 0;
    for (int i : viewerFds) {
      FD_SET(i, &rfds);
      maxFd = max(maxFd, i);
    }
    for (int i : workerFds) {
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
      for (int i : viewerFds) {
        if (FD_ISSET(i, &rfds)) {
          int clientFd = socketHandler->accept(i);
          if (clientFd >= 0) {
            startConnectionThread(clientFd, false);
          }
        }
      }
      for (int i : workerFds) {
        if (FD_ISSET(i, &rfds)) {
          int clientFd = socketHandler->accept(i);
          if (clientFd >= 0) {
            startConnectionThread(clientFd, true);
          }
        }
      }
    }

    if (millisSince(lastPrune) >= options.workerPruneIntervalMs) {
      lastPrune = Clock::now();
      pruneWorkers();
      joinFinishedThreads(false);
    }
    if (millisSince(lastCleanup) >= options.cleanupIntervalMs) {
      lastCleanup = Clock::now();
      try {
        router->cleanupOrphanedSessions();
      } catch (const std::exception& ex) {
        STERROR << "Orphan cleanup failed: " << ex.what();
      }
    }
  }

  socketHandler->stopListening(viewerEndpoint);
  socketHandler->stopListening(workerEndpoint);
  joinFinishedThreads(true);
  LOG(INFO) << "Router server stopped";
}

void RouterServer::startConnectionThread(int fd, bool worker) {
  lock_guard<mutex> guard(connectionThreadMutex);
  ConnectionThread connectionThread;
  connectionThread.done.reset(new std::atomic<bool>(false));
  auto done = connectionThread.done;
  connectionThread.t.reset(new thread([this, fd, worker, done]() {
    if (worker) {
      handleWorker(fd);
    } else {
      handleViewer(fd);
    }
    *done = true;
  }));
  connectionThreads.push_back(connectionThread);
}

void RouterServer::joinFinishedThreads(bool all) {
  vector<ConnectionThread> toJoin;
  {
    lock_guard<mutex> guard(connectionThreadMutex);
    for (auto it = connectionThreads.begin(); it != connectionThreads.end();) {
      if (all || *(it->done)) {
        toJoin.push_back(*it);
        it = connectionThreads.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& connectionThread : toJoin) {
    if (connectionThread.t->joinable()) {
      connectionThread.t->join();
    }
  }
}

void RouterServer::pruneWorkers() {
  for (auto& channel : workers->pruneStale(options.workerMaxSilenceMs)) {
    channel->sendClose(CLOSE_WORKER_STALE, "No heartbeat");
    channel->drain(CLOSE_LINGER_MS);
    // The worker's thread sees the dead channel and closes the socket
    channel->markDead();
  }
}

void RouterServer::handleViewer(int fd) {
  auto channel = make_shared<PacketChannel>(socketHandler, fd,
                                            options.viewerBufferBytes);
  el::Helpers::setThreadName("viewer-" + channel->getId().substr(0, 8));
  string sessionId;
  AdminRouter::AttachOutcome outcome = AdminRouter::AttachOutcome::CLOSED;
  bool attached = false;

  try {
    Packet packet;
    bool gotPacket = socketHandler->readPacket(fd, &packet);
    if (gotPacket && packet.getHeader() == PacketType::VIEWER_ATTACH) {
      sessionId = stringToProto<ViewerAttach>(packet.getPayload()).session_id();
    }
    if (sessionId.empty()) {
      channel->sendClose(CLOSE_MISSING_SESSION_ID, "Missing session id");
    } else {
      outcome = router->attach(sessionId, channel);
      attached = outcome != AdminRouter::AttachOutcome::CLOSED;
    }

    while (attached && !halt && !channel->isDead()) {
      int upstreamFd = -1;
      if (outcome == AdminRouter::AttachOutcome::LOCAL) {
        upstreamFd = router->getUpstreamFd(channel);
        if (upstreamFd < 0) {
          break;
        }
      }

      fd_set rfd;
      timeval tv;
      FD_ZERO(&rfd);
      FD_SET(fd, &rfd);
      int maxfd = fd;
      if (upstreamFd >= 0) {
        FD_SET(upstreamFd, &rfd);
        maxfd = max(maxfd, upstreamFd);
      }
      tv.tv_sec = 0;
      tv.tv_usec = 10000;
      select(maxfd + 1, &rfd, NULL, NULL, &tv);

      if (upstreamFd >= 0 && FD_ISSET(upstreamFd, &rfd)) {
        if (!router->relayUpstream(channel)) {
          break;
        }
      }
      if (FD_ISSET(fd, &rfd)) {
        if (socketHandler->readPacket(fd, &packet)) {
          if (packet.getHeader() == PacketType::CONNECTION_CLOSE) {
            VLOG(1) << "Viewer " << channel->getId() << " closed";
            break;
          }
          router->forward(channel, packet);
        }
      }
      channel->flush();
    }
  } catch (const std::runtime_error& ex) {
    LOG(INFO) << "Viewer " << channel->getId() << " of "
              << (sessionId.empty() ? "<none>" : sessionId)
              << " disconnected: " << ex.what();
  }

  channel->drain(CLOSE_LINGER_MS);
  if (attached) {
    router->detach(sessionId, channel);
  }
  channel->markDead();
  socketHandler->close(fd);
}

void RouterServer::handleWorker(int fd) {
  auto channel = make_shared<PacketChannel>(socketHandler, fd,
                                            options.viewerBufferBytes);
  string workerId;

  try {
    Packet packet;
    bool gotPacket = socketHandler->readPacket(fd, &packet);
    if (!gotPacket || packet.getHeader() != PacketType::WORKER_REGISTER) {
      WorkerRegistered registered;
      registered.set_ok(false);
      registered.set_error("Expected a registration");
      channel->send(Packet::fromProto(PacketType::WORKER_REGISTERED, registered));
      channel->drain(CLOSE_LINGER_MS);
      socketHandler->close(fd);
      return;
    }
    auto registration = stringToProto<WorkerRegister>(packet.getPayload());
    workerId = registration.id();
    el::Helpers::setThreadName("worker-" + workerId);
    auto replaced = workers->registerWorker(registration, channel);
    if (replaced) {
      replaced->sendClose(CLOSE_WORKER_REPLACED, "Worker reconnected");
      replaced->drain(CLOSE_LINGER_MS);
      replaced->markDead();
    }
    WorkerRegistered registered;
    registered.set_ok(true);
    channel->send(Packet::fromProto(PacketType::WORKER_REGISTERED, registered));

    while (!halt && !channel->isDead()) {
      if (socketHandler->waitForData(fd, 10)) {
        if (socketHandler->readPacket(fd, &packet)) {
          switch (packet.getHeader()) {
            case PacketType::WORKER_HEARTBEAT:
              workers->heartbeat(workerId, stringToProto<WorkerHeartbeat>(
                                               packet.getPayload()));
              break;
            case PacketType::WORKER_SESSION_OUTPUT:
              router->handleWorkerOutput(
                  stringToProto<WorkerSessionOutput>(packet.getPayload()));
              break;
            case PacketType::WORKER_SESSION_ENDED:
              router->handleWorkerSessionEnded(
                  stringToProto<WorkerSessionEnded>(packet.getPayload()));
              break;
            default:
              LOG(WARNING) << "Unexpected packet from worker " << workerId
                           << ": " << int(packet.getHeader());
          }
        }
      }
      channel->flush();
    }
  } catch (const std::runtime_error& ex) {
    LOG(INFO) << "Worker connection " << (workerId.empty() ? "<new>" : workerId)
              << " closed: " << ex.what();
  }

  if (!workerId.empty()) {
    workers->removeWorker(workerId, channel);
  }
  channel->markDead();
  socketHandler->close(fd);
}
}  // namespace tether

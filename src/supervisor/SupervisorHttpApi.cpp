#include "SupervisorHttpApi.hpp"

namespace tether {
SupervisorHttpApi::SupervisorHttpApi(shared_ptr<ProcessSupervisor> _supervisor,
                                     shared_ptr<SessionStore> _store)
    : supervisor(_supervisor), store(_store) {
  server.Post("/spawn", [this](const httplib::Request& req,
                               httplib::Response& res) {
    handleSpawn(req, res);
  });
  server.Post(R"(/kill/([^/]+))",
              [this](const httplib::Request& req, httplib::Response& res) {
                handleKill(req.matches[1].str(), res);
              });
  server.Post(R"(/resize/([^/]+))",
              [this](const httplib::Request& req, httplib::Response& res) {
                handleResize(req.matches[1].str(), req, res);
              });
  server.Post(R"(/input/([^/]+))",
              [this](const httplib::Request& req, httplib::Response& res) {
                handleInput(req.matches[1].str(), req, res);
              });
  server.Get(R"(/status/([^/]+))",
             [this](const httplib::Request& req, httplib::Response& res) {
               handleStatus(req.matches[1].str(), res);
             });
  server.Get("/health", [this](const httplib::Request&,
                               httplib::Response& res) { handleHealth(res); });
  server.Get("/waiting", [this](const httplib::Request&,
                                httplib::Response& res) { handleWaiting(res); });
}

SupervisorHttpApi::~SupervisorHttpApi() { stop(); }

void SupervisorHttpApi::start(const string& host, int port) {
  if (!server.bind_to_port(host.c_str(), port)) {
    throw std::runtime_error("Could not bind control API to " + host + ":" +
                             to_string(port));
  }
  LOG(INFO) << "Control API listening on " << host << ":" << port;
  serverThread.reset(new thread([this]() {
    el::Helpers::setThreadName("http-api");
    server.listen_after_bind();
  }));
}

void SupervisorHttpApi::stop() {
  server.stop();
  if (serverThread && serverThread->joinable()) {
    serverThread->join();
  }
  serverThread.reset();
}

void SupervisorHttpApi::reply(httplib::Response& res, int status,
                              const json& body) {
  res.status = status;
  res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace),
                  "application/json");
}

void SupervisorHttpApi::replyError(httplib::Response& res, int status,
                                   const string& error) {
  reply(res, status, json{{"error", error}});
}

SpawnRequest SupervisorHttpApi::spawnRequestFromJson(const json& body) {
  SpawnRequest request;
  request.sessionId = jsonValueOr(body, "sessionId", string());
  request.cwd = jsonValueOr(body, "cwd", string());
  if (request.sessionId.empty()) {
    throw std::runtime_error("sessionId is required");
  }
  if (request.cwd.empty()) {
    throw std::runtime_error("cwd is required");
  }
  request.prompt = jsonValueOr(body, "prompt", string());
  request.permissionProfile = permissionProfileFromString(
      jsonValueOr(body, "permissionProfile", string("interactive")));
  request.allowedTools = jsonValueOr(body, "allowedTools", string());
  request.agentSessionId = jsonValueOr(body, "agentSessionId", string());
  request.resumeSessionId = jsonValueOr(body, "resumeSessionId", string());
  request.parentSessionId = jsonValueOr(body, "parentSessionId", string());
  return request;
}

void SupervisorHttpApi::handleSpawn(const httplib::Request& req,
                                    httplib::Response& res) {
  SpawnRequest request;
  try {
    request = spawnRequestFromJson(json::parse(req.body));
  } catch (const std::exception& ex) {
    replyError(res, 400, ex.what());
    return;
  }

  try {
    supervisor->spawn(request);
  } catch (const SpawnConflict& ex) {
    replyError(res, 409, ex.what());
    return;
  } catch (const std::exception& ex) {
    STERROR << "Spawn of " << request.sessionId << " failed: " << ex.what();
    string completedAt = nowIso8601();
    try {
      store->update(request.sessionId, [&](SessionRecord* r) {
        if (!isTerminalStatus(r->status)) {
          r->status = SessionStatus::FAILED;
          r->completedAt = completedAt;
        }
      });
    } catch (const std::exception& storeEx) {
      STERROR << "Could not mark " << request.sessionId
              << " failed: " << storeEx.what();
    }
    supervisor->failPendingViewers(request.sessionId);
    replyError(res, 500, ex.what());
    return;
  }
  reply(res, 200, json{{"ok", true}, {"sessionId", request.sessionId}});
}

void SupervisorHttpApi::handleKill(const string& sessionId,
                                   httplib::Response& res) {
  if (!supervisor->kill(sessionId)) {
    replyError(res, 404, "Session " + sessionId + " is not active");
    return;
  }
  reply(res, 200, json{{"ok", true}});
}

void SupervisorHttpApi::handleResize(const string& sessionId,
                                     const httplib::Request& req,
                                     httplib::Response& res) {
  int cols, rows;
  try {
    json body = json::parse(req.body);
    cols = jsonValueOr(body, "cols", 0);
    rows = jsonValueOr(body, "rows", 0);
  } catch (const std::exception& ex) {
    replyError(res, 400, ex.what());
    return;
  }
  if (cols <= 0 || rows <= 0) {
    replyError(res, 400, "cols and rows must be positive");
    return;
  }
  supervisor->resize(sessionId, cols, rows);
  reply(res, 200, json{{"ok", true}});
}

void SupervisorHttpApi::handleInput(const string& sessionId,
                                    const httplib::Request& req,
                                    httplib::Response& res) {
  string data;
  try {
    data = jsonValueOr(json::parse(req.body), "data", string());
  } catch (const std::exception& ex) {
    replyError(res, 400, ex.what());
    return;
  }
  if (!data.empty()) {
    supervisor->write(sessionId, data);
  }
  reply(res, 200, json{{"ok", true}});
}

void SupervisorHttpApi::handleStatus(const string& sessionId,
                                     httplib::Response& res) {
  auto info = supervisor->status(sessionId);
  if (!info) {
    replyError(res, 404, SessionNotFound(sessionId).what());
    return;
  }
  reply(res, 200,
        json{{"status", sessionStatusToString(info->status)},
             {"active", info->active},
             {"outputSeq", info->outputSeq},
             {"totalBytes", info->totalBytes},
             {"waitingForInput", info->waitingForInput},
             {"hasStarted", info->started}});
}

void SupervisorHttpApi::handleHealth(httplib::Response& res) {
  bool tmux = false;
  auto multiplexer = supervisor->getMultiplexer();
  if (multiplexer) {
    try {
      tmux = multiplexer->isAvailable();
    } catch (const std::exception& ex) {
      LOG(WARNING) << "Multiplexer probe failed: " << ex.what();
    }
  }
  vector<string> ids = supervisor->activeSessionIds();
  reply(res, 200,
        json{{"ok", !supervisor->isShuttingDown()},
             {"tmux", tmux},
             {"activeSessions", ids.size()},
             {"sessions", ids}});
}

void SupervisorHttpApi::handleWaiting(httplib::Response& res) {
  json body = json::object();
  for (const auto& it : supervisor->waitingStates()) {
    body[it.first] = json{{"waitingForInput", it.second}};
  }
  reply(res, 200, body);
}
}  // namespace tether

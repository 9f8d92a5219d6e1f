#include "SupervisorLink.hpp"

#include "JsonLib.hpp"

namespace tether {
HttpSupervisorLink::HttpSupervisorLink(const string& _host, int _port,
                                       int64_t _timeoutMs)
    : host(_host), port(_port), timeoutMs(_timeoutMs) {}

unique_ptr<httplib::Client> HttpSupervisorLink::makeClient() {
  unique_ptr<httplib::Client> client(new httplib::Client(host, port));
  time_t seconds = timeoutMs / 1000;
  time_t micros = (timeoutMs % 1000) * 1000;
  client->set_connection_timeout(seconds, micros);
  client->set_read_timeout(seconds, micros);
  client->set_write_timeout(seconds, micros);
  return client;
}

optional<set<string>> HttpSupervisorLink::activeSessionIds() {
  auto client = makeClient();
  auto res = client->Get("/health");
  if (!res) {
    LOG(WARNING) << "Supervisor health check failed: "
                 << httplib::to_string(res.error());
    return nullopt;
  }
  if (res->status != 200) {
    LOG(WARNING) << "Supervisor health check returned " << res->status;
    return nullopt;
  }
  try {
    json body = json::parse(res->body);
    set<string> ids;
    for (const auto& id : body.at("sessions")) {
      ids.insert(id.get<string>());
    }
    return ids;
  } catch (const json::exception& ex) {
    LOG(WARNING) << "Malformed health response from supervisor: "
                 << ex.what();
    return nullopt;
  }
}

SupervisorLink::KillResult HttpSupervisorLink::killSession(
    const string& sessionId) {
  auto client = makeClient();
  auto res = client->Post("/kill/" + sessionId, "", "application/json");
  if (!res) {
    LOG(WARNING) << "Could not reach supervisor to kill " << sessionId << ": "
                 << httplib::to_string(res.error());
    return KillResult::UNREACHABLE;
  }
  if (res->status == 200) {
    return KillResult::KILLED;
  }
  if (res->status == 404) {
    return KillResult::NOT_ACTIVE;
  }
  LOG(WARNING) << "Supervisor kill of " << sessionId << " returned "
               << res->status;
  return KillResult::UNREACHABLE;
}
}  // namespace tether

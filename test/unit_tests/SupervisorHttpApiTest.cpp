#include "SupervisorHttpApi.hpp"

#include "FakeMultiplexer.hpp"
#include "FakeSessionProcess.hpp"
#include "TestHeaders.hpp"

using namespace tether;

namespace {
struct ApiHarness {
  ApiHarness()
      : store(new JsonSessionStore("")),
        factory(new FakeProcessFactory()),
        multiplexer(new FakeMultiplexer()) {
    SupervisorConfig config;
    config.shell = "/bin/sh";
    config.healthCheckDelayMs = 60000;
    supervisor.reset(new ProcessSupervisor(
        config, store, make_shared<OutputLedger>(1000, 60000), factory,
        multiplexer));
    api.reset(new SupervisorHttpApi(supervisor, store));
  }

  ~ApiHarness() { supervisor->shutdown(); }

  json spawn(const json& body, int* status) {
    httplib::Request req;
    httplib::Response res;
    req.body = body.dump();
    api->handleSpawn(req, res);
    *status = res.status;
    return json::parse(res.body);
  }

  shared_ptr<JsonSessionStore> store;
  shared_ptr<FakeProcessFactory> factory;
  shared_ptr<FakeMultiplexer> multiplexer;
  shared_ptr<ProcessSupervisor> supervisor;
  shared_ptr<SupervisorHttpApi> api;
};
}  // namespace

TEST_CASE("Spawn request parsing", "[SupervisorHttpApi]") {
  json body = {{"sessionId", "s1"},
               {"cwd", "/work"},
               {"prompt", "hello"},
               {"permissionProfile", "yolo"},
               {"parentSessionId", "parent"}};
  SpawnRequest request = SupervisorHttpApi::spawnRequestFromJson(body);
  REQUIRE(request.sessionId == "s1");
  REQUIRE(request.cwd == "/work");
  REQUIRE(request.prompt == "hello");
  REQUIRE(request.permissionProfile == PermissionProfile::YOLO);
  REQUIRE(request.parentSessionId == "parent");

  REQUIRE_THROWS_AS(SupervisorHttpApi::spawnRequestFromJson(
                        json{{"sessionId", "s1"}}),
                    std::runtime_error);
  REQUIRE_THROWS_AS(
      SupervisorHttpApi::spawnRequestFromJson(json{{"cwd", "/work"}}),
      std::runtime_error);
}

TEST_CASE("Spawn endpoint", "[SupervisorHttpApi]") {
  ApiHarness h;
  int status;

  SECTION("Spawn and conflict") {
    json body = {{"sessionId", "s1"},
                 {"cwd", "/tmp"},
                 {"permissionProfile", "plain"},
                 {"parentSessionId", "parent"}};
    json reply = h.spawn(body, &status);
    REQUIRE(status == 200);
    REQUIRE(reply["ok"] == true);
    REQUIRE(h.supervisor->isActive("s1"));
    REQUIRE(*h.store->get("s1")->parentSessionId == "parent");

    h.spawn(body, &status);
    REQUIRE(status == 409);
    REQUIRE(h.factory->count() == 1);
  }

  SECTION("Bad body") {
    httplib::Request req;
    httplib::Response res;
    req.body = "{not json";
    h.api->handleSpawn(req, res);
    REQUIRE(res.status == 400);
    h.spawn(json{{"sessionId", "s1"}}, &status);
    REQUIRE(status == 400);
  }

  SECTION("Process start failure marks the record failed") {
    SessionRecord record;
    record.id = "s1";
    record.status = SessionStatus::PENDING;
    h.store->put(record);
    h.factory->failNext = true;

    json reply = h.spawn(json{{"sessionId", "s1"}, {"cwd", "/tmp"}}, &status);
    REQUIRE(status == 500);
    REQUIRE(reply.contains("error"));
    REQUIRE(h.store->get("s1")->status == SessionStatus::FAILED);
    REQUIRE(!h.supervisor->isActive("s1"));
    // The multiplexed session created for it is cleaned up
    REQUIRE(h.multiplexer->killed == vector<string>({"s1"}));
  }
}

TEST_CASE("Session control endpoints", "[SupervisorHttpApi]") {
  ApiHarness h;
  int status;
  h.spawn(json{{"sessionId", "s1"}, {"cwd", "/tmp"},
               {"permissionProfile", "plain"}},
          &status);
  REQUIRE(status == 200);
  auto process = h.factory->last();

  SECTION("Input and resize reach the process") {
    httplib::Request req;
    httplib::Response res;
    req.body = json{{"data", "echo hi\r"}}.dump();
    h.api->handleInput("s1", req, res);
    REQUIRE(res.status == 200);
    REQUIRE(process->getWrites() == vector<string>({"echo hi\r"}));

    httplib::Response resizeRes;
    req.body = json{{"cols", 80}, {"rows", 24}}.dump();
    h.api->handleResize("s1", req, resizeRes);
    REQUIRE(resizeRes.status == 200);
    REQUIRE(process->getResizes()[0] == make_pair(80, 24));

    httplib::Response badRes;
    req.body = json{{"cols", 0}, {"rows", 24}}.dump();
    h.api->handleResize("s1", req, badRes);
    REQUIRE(badRes.status == 400);
    REQUIRE(process->getResizes().size() == 1);
  }

  SECTION("Status and health") {
    httplib::Response res;
    h.api->handleStatus("s1", res);
    REQUIRE(res.status == 200);
    json info = json::parse(res.body);
    REQUIRE(info["status"] == "running");
    REQUIRE(info["active"] == true);

    httplib::Response missing;
    h.api->handleStatus("nope", missing);
    REQUIRE(missing.status == 404);

    httplib::Response health;
    h.api->handleHealth(health);
    json healthBody = json::parse(health.body);
    REQUIRE(healthBody["ok"] == true);
    REQUIRE(healthBody["tmux"] == true);
    REQUIRE(healthBody["activeSessions"] == 1);
    REQUIRE(healthBody["sessions"] == json::array({"s1"}));

    httplib::Response waiting;
    h.api->handleWaiting(waiting);
    REQUIRE(json::parse(waiting.body)["s1"]["waitingForInput"] == false);
  }

  SECTION("Kill") {
    httplib::Response res;
    h.api->handleKill("s1", res);
    REQUIRE(res.status == 200);
    REQUIRE(h.store->get("s1")->status == SessionStatus::KILLED);

    httplib::Response again;
    h.api->handleKill("s1", again);
    REQUIRE(again.status == 404);
  }
}

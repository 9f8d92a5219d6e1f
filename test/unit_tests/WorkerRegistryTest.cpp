#include "WorkerRegistry.hpp"

#include "FakeSocketHandler.hpp"
#include "TestHeaders.hpp"

using namespace tether;

namespace {
WorkerRegister makeRegistration(const string& id,
                                const vector<string>& active) {
  WorkerRegister registration;
  registration.set_id(id);
  registration.set_name("builder");
  registration.set_hostname("host-" + id);
  registration.set_max_sessions(4);
  for (const auto& sessionId : active) {
    registration.add_active_sessions(sessionId);
  }
  return registration;
}
}  // namespace

TEST_CASE("Worker registration and heartbeats", "[WorkerRegistry]") {
  auto socketHandler = make_shared<FakeSocketHandler>();
  auto first = make_shared<PacketChannel>(
      socketHandler, socketHandler->createPair().first, 4096);
  auto second = make_shared<PacketChannel>(
      socketHandler, socketHandler->createPair().first, 4096);
  WorkerRegistry registry;

  REQUIRE(!registry.registerWorker(makeRegistration("w1", {"a"}), first));
  auto worker = registry.getWorker("w1");
  REQUIRE(worker);
  REQUIRE(worker->hostname == "host-w1");
  REQUIRE(worker->maxSessions == 4);
  REQUIRE(worker->activeSessions == set<string>({"a"}));
  REQUIRE(registry.isLive("w1"));

  SECTION("Heartbeat replaces the active set") {
    WorkerHeartbeat heartbeat;
    heartbeat.add_active_sessions("b");
    heartbeat.add_active_sessions("c");
    registry.heartbeat("w1", heartbeat);
    REQUIRE(registry.getWorker("w1")->activeSessions ==
            set<string>({"b", "c"}));
  }

  SECTION("Re-registration returns the replaced connection") {
    auto replaced = registry.registerWorker(makeRegistration("w1", {}), second);
    REQUIRE(replaced == first);
    // The old connection going away must not remove the new one
    registry.removeWorker("w1", first);
    REQUIRE(registry.getWorker("w1"));
    registry.removeWorker("w1", second);
    REQUIRE(!registry.getWorker("w1"));
  }

  SECTION("Dead channels are not live") {
    first->markDead();
    REQUIRE(!registry.isLive("w1"));
    REQUIRE(registry.pruneStale(60000).size() == 1);
    REQUIRE(registry.listWorkers().empty());
  }

  SECTION("Silent workers are pruned") {
    REQUIRE(registry.pruneStale(60000).empty());
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    auto dropped = registry.pruneStale(10);
    REQUIRE(dropped.size() == 1);
    REQUIRE(dropped[0] == first);
    REQUIRE(!registry.isLive("w1"));
  }
}

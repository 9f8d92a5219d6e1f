#include "AdminRouter.hpp"
#include "FakeSessionProcess.hpp"
#include "FakeSocketHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "ProcessSupervisor.hpp"
#include "SupervisorHttpApi.hpp"
#include "SupervisorServer.hpp"
#include "TestHeaders.hpp"

using namespace tether;

namespace {
const int TEST_HTTP_PORT = 48731;

/**
 * @brief A supervisor daemon (viewer server plus control API) running on
 * a UNIX socket inside a temporary directory.
 */
struct SupervisorDaemon {
  SupervisorDaemon()
      : pipeSocketHandler(new PipeSocketHandler()),
        store(new JsonSessionStore(dir.path + "/sessions.json")),
        factory(new FakeProcessFactory()) {
    config.shell = "/bin/sh";
    config.healthCheckDelayMs = 60000;
    endpoint.set_name(dir.path + "/supervisor.sock");
    supervisor.reset(new ProcessSupervisor(
        config, store, make_shared<OutputLedger>(1000, 60000), factory,
        nullptr));
    server.reset(
        new SupervisorServer(pipeSocketHandler, endpoint, supervisor, config));
    serverThread.reset(new thread([this]() { server->run(); }));
    REQUIRE(waitUntil([this]() { return fs::exists(endpoint.name()); }));
    // The socket file appears on bind, just before listen
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }

  ~SupervisorDaemon() { stop(); }

  void stop() {
    if (!serverThread) {
      return;
    }
    server->shutdown();
    serverThread->join();
    serverThread.reset();
    supervisor->shutdown();
  }

  TempDir dir;
  SupervisorConfig config;
  SocketEndpoint endpoint;
  shared_ptr<PipeSocketHandler> pipeSocketHandler;
  shared_ptr<JsonSessionStore> store;
  shared_ptr<FakeProcessFactory> factory;
  shared_ptr<ProcessSupervisor> supervisor;
  shared_ptr<SupervisorServer> server;
  shared_ptr<thread> serverThread;
};

// Pumps the bridge until the viewer side sees a packet of the given type
optional<Packet> relayUntil(AdminRouter* router,
                            shared_ptr<PacketChannel> viewer,
                            FakeSocketHandler* viewerSide, int viewerFd,
                            PacketType type) {
  auto start = Clock::now();
  while (millisSince(start) < 5000) {
    if (!router->relayUpstream(viewer)) {
      // Bridge is gone, whatever was relayed last is still readable
      return viewerSide->readUntil(viewerFd, type, 500);
    }
    while (viewerSide->hasData(viewerFd)) {
      Packet packet;
      if (viewerSide->readPacket(viewerFd, &packet) &&
          packet.getHeader() == type) {
        return packet;
      }
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return nullopt;
}
}  // namespace

TEST_CASE("Router bridges a viewer to the supervisor",
          "[RouterBridge][integration]") {
  SupervisorDaemon daemon;
  SpawnRequest request;
  request.sessionId = "s1";
  request.cwd = "/tmp";
  request.permissionProfile = PermissionProfile::PLAIN;
  daemon.supervisor->spawn(request);
  auto process = daemon.factory->last();
  process->emit("earlier output");
  REQUIRE(waitUntil(
      [&]() { return daemon.supervisor->status("s1")->outputSeq == 1; }));

  auto viewerSide = make_shared<FakeSocketHandler>();
  auto fds = viewerSide->createPair();
  auto viewer = make_shared<PacketChannel>(viewerSide, fds.first, 1 << 20);
  AdminRouter router(daemon.store, make_shared<WorkerRegistry>(),
                     make_shared<HttpSupervisorLink>("127.0.0.1", 1, 200),
                     daemon.pipeSocketHandler, daemon.endpoint, nullptr);

  REQUIRE(router.attach("s1", viewer) == AdminRouter::AttachOutcome::LOCAL);
  auto history = relayUntil(&router, viewer, viewerSide.get(), fds.second,
                            PacketType::HISTORY);
  REQUIRE(history);
  REQUIRE(stringToProto<History>(history->getPayload()).data() ==
          "earlier output");

  process->emit("live output");
  auto output = relayUntil(&router, viewer, viewerSide.get(), fds.second,
                           PacketType::SEQUENCED_OUTPUT);
  REQUIRE(output);
  SequencedOutput sequenced =
      stringToProto<SequencedOutput>(output->getPayload());
  REQUIRE(sequenced.seq() == 2);
  REQUIRE(sequenced.content().data() == "live output");

  SequencedInput input;
  input.set_session_id("s1");
  input.set_seq(1);
  input.mutable_content()->set_kind(InputContent::WRITE);
  input.mutable_content()->set_data("y\r");
  router.forward(viewer, Packet::fromProto(PacketType::SEQUENCED_INPUT, input));
  auto ack = relayUntil(&router, viewer, viewerSide.get(), fds.second,
                        PacketType::INPUT_ACK);
  REQUIRE(ack);
  REQUIRE(stringToProto<InputAck>(ack->getPayload()).ack_seq() == 1);
  REQUIRE(process->getWrites() == vector<string>({"y\r"}));

  SECTION("Supervisor going away closes the viewer with 4012") {
    daemon.stop();
    auto close = relayUntil(&router, viewer, viewerSide.get(), fds.second,
                            PacketType::CONNECTION_CLOSE);
    REQUIRE(close);
    REQUIRE(stringToProto<ConnectionClose>(close->getPayload()).code() ==
            CLOSE_UPSTREAM_CLOSED);
  }

  SECTION("Process exit reaches the viewer") {
    process->exit(0);
    auto exit = relayUntil(&router, viewer, viewerSide.get(), fds.second,
                           PacketType::SEQUENCED_OUTPUT);
    REQUIRE(exit);
    OutputContent content =
        stringToProto<SequencedOutput>(exit->getPayload()).content();
    REQUIRE(content.kind() == OutputContent::EXIT);
    REQUIRE(content.status() == "completed");
  }

  router.detach("s1", viewer);
}

TEST_CASE("Supervisor refuses unknown sessions through the router",
          "[RouterBridge][integration]") {
  SupervisorDaemon daemon;
  auto viewerSide = make_shared<FakeSocketHandler>();
  auto fds = viewerSide->createPair();
  auto viewer = make_shared<PacketChannel>(viewerSide, fds.first, 1 << 20);
  AdminRouter router(daemon.store, make_shared<WorkerRegistry>(),
                     make_shared<HttpSupervisorLink>("127.0.0.1", 1, 200),
                     daemon.pipeSocketHandler, daemon.endpoint, nullptr);

  REQUIRE(router.attach("missing", viewer) ==
          AdminRouter::AttachOutcome::LOCAL);
  auto close = relayUntil(&router, viewer, viewerSide.get(), fds.second,
                          PacketType::CONNECTION_CLOSE);
  REQUIRE(close);
  REQUIRE(stringToProto<ConnectionClose>(close->getPayload()).code() ==
          CLOSE_SESSION_NOT_FOUND);
}

TEST_CASE("Router talks to the supervisor control API",
          "[RouterBridge][integration]") {
  SupervisorDaemon daemon;
  SupervisorHttpApi api(daemon.supervisor, daemon.store);
  api.start("127.0.0.1", TEST_HTTP_PORT);
  HttpSupervisorLink link("127.0.0.1", TEST_HTTP_PORT, 2000);

  SpawnRequest request;
  request.sessionId = "s1";
  request.cwd = "/tmp";
  request.permissionProfile = PermissionProfile::PLAIN;
  daemon.supervisor->spawn(request);

  auto active = link.activeSessionIds();
  REQUIRE(active);
  REQUIRE(*active == set<string>({"s1"}));

  REQUIRE(link.killSession("s1") == SupervisorLink::KillResult::KILLED);
  REQUIRE(link.killSession("s1") == SupervisorLink::KillResult::NOT_ACTIVE);
  REQUIRE(link.activeSessionIds()->empty());
  api.stop();

  HttpSupervisorLink unreachable("127.0.0.1", TEST_HTTP_PORT, 200);
  REQUIRE(!unreachable.activeSessionIds());
  REQUIRE(unreachable.killSession("s1") ==
          SupervisorLink::KillResult::UNREACHABLE);
}

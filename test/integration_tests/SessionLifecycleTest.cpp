#include "ProcessSupervisor.hpp"
#include "PtySessionProcess.hpp"
#include "TestHeaders.hpp"

using namespace tether;

namespace {
shared_ptr<ProcessSupervisor> makeSupervisor(const SupervisorConfig& config,
                                             shared_ptr<SessionStore> store) {
  return make_shared<ProcessSupervisor>(
      config, store, make_shared<OutputLedger>(1000, 60000),
      make_shared<PtyProcessFactory>(), nullptr);
}
}  // namespace

TEST_CASE("One-shot agent runs to completion in a pty",
          "[SessionLifecycle][integration]") {
  SupervisorConfig config;
  config.agentBinary = "/bin/echo";
  config.healthCheckDelayMs = 60000;
  auto store = make_shared<JsonSessionStore>("");
  auto supervisor = makeSupervisor(config, store);

  SpawnRequest request;
  request.sessionId = "echo-session";
  request.cwd = "/tmp";
  request.prompt = "hello from the agent";
  request.permissionProfile = PermissionProfile::AUTO;
  supervisor->spawn(request);

  REQUIRE(waitUntil([&]() {
    auto record = store->get("echo-session");
    return record && record->status == SessionStatus::COMPLETED;
  }));
  auto record = store->get("echo-session");
  REQUIRE(*record->exitCode == 0);
  REQUIRE(record->outputLog.find("hello from the agent") != string::npos);
  REQUIRE(record->outputBytes == int64_t(record->outputLog.size()));
  REQUIRE(record->lastOutputSeq >= 2);
  REQUIRE(!supervisor->isActive("echo-session"));
  supervisor->shutdown();
}

TEST_CASE("Shell session reports a non-zero exit",
          "[SessionLifecycle][integration]") {
  SupervisorConfig config;
  config.shell = "/bin/sh";
  auto store = make_shared<JsonSessionStore>("");
  auto supervisor = makeSupervisor(config, store);

  SpawnRequest request;
  request.sessionId = "shell-session";
  request.cwd = "/tmp";
  request.permissionProfile = PermissionProfile::PLAIN;
  supervisor->spawn(request);
  REQUIRE(supervisor->isActive("shell-session"));

  supervisor->resize("shell-session", 100, 30);
  supervisor->write("shell-session", "exit 3\r");

  REQUIRE(waitUntil([&]() {
    auto record = store->get("shell-session");
    return record && isTerminalStatus(record->status);
  }));
  auto record = store->get("shell-session");
  REQUIRE(record->status == SessionStatus::FAILED);
  REQUIRE(*record->exitCode == 3);
  supervisor->shutdown();
}

TEST_CASE("Killing a pty session stops the process",
          "[SessionLifecycle][integration]") {
  SupervisorConfig config;
  config.shell = "/bin/sh";
  auto store = make_shared<JsonSessionStore>("");
  auto supervisor = makeSupervisor(config, store);

  SpawnRequest request;
  request.sessionId = "kill-session";
  request.cwd = "/tmp";
  request.permissionProfile = PermissionProfile::PLAIN;
  supervisor->spawn(request);
  pid_t pid = pid_t(*store->get("kill-session")->processId);

  REQUIRE(supervisor->kill("kill-session"));
  REQUIRE(store->get("kill-session")->status == SessionStatus::KILLED);
  // The session thread reaps the child
  REQUIRE(waitUntil([&]() { return ::kill(pid, 0) < 0; }, 10000));
  supervisor->shutdown();
}

TEST_CASE("Input racing a shell exit is dropped",
          "[SessionLifecycle][integration]") {
  SupervisorConfig config;
  config.shell = "/bin/sh";
  auto store = make_shared<JsonSessionStore>("");
  auto supervisor = makeSupervisor(config, store);

  SpawnRequest request;
  request.sessionId = "racing-session";
  request.cwd = "/tmp";
  request.permissionProfile = PermissionProfile::PLAIN;
  supervisor->spawn(request);

  std::atomic<bool> stop(false);
  thread typist([&]() {
    while (!stop) {
      supervisor->write("racing-session", "x");
      supervisor->resize("racing-session", 90, 30);
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  });
  std::this_thread::sleep_for(std::chrono::milliseconds(50));
  // One write so the typist cannot split the command
  supervisor->write("racing-session", "\rexit 4\r");

  bool ended = waitUntil([&]() {
    auto record = store->get("racing-session");
    return record && isTerminalStatus(record->status);
  });
  stop = true;
  typist.join();
  REQUIRE(ended);
  REQUIRE(*store->get("racing-session")->exitCode == 4);
  REQUIRE(!supervisor->isActive("racing-session"));
  supervisor->shutdown();
}

TEST_CASE("A closed pty ignores writes even when its fd number is reused",
          "[SessionLifecycle][integration]") {
  LaunchSpec launch;
  launch.command = "/bin/true";
  PtySessionProcess process;
  process.start(launch);
  REQUIRE(process.waitForExit() == 0);

  int pipeFds[2];
  FATAL_FAIL(::pipe(pipeFds));
  int oldFd = process.getFd();
  process.cleanup();
  REQUIRE(process.getFd() < 0);

  // Put the write end of the pipe where the pty master used to be
  FATAL_FAIL(::dup2(pipeFds[1], oldFd));
  process.write("stray keystrokes");
  process.resize(80, 24);

  FATAL_FAIL(fcntl(pipeFds[0], F_SETFL, O_NONBLOCK));
  char b[64];
  ssize_t rc = ::read(pipeFds[0], b, sizeof(b));
  REQUIRE(rc < 0);
  REQUIRE(errno == EAGAIN);

  ::close(oldFd);
  ::close(pipeFds[0]);
  ::close(pipeFds[1]);
}

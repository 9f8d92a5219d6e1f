#include "CommandBuilder.hpp"

#include "TestHeaders.hpp"

using namespace tether;

namespace {
SupervisorConfig testConfig() {
  SupervisorConfig config;
  config.agentBinary = "agent";
  config.shell = "/bin/zsh";
  config.defaultCols = 100;
  config.defaultRows = 30;
  return config;
}

bool hasPair(const vector<string>& args, const string& flag,
             const string& value) {
  for (size_t a = 0; a + 1 < args.size(); a++) {
    if (args[a] == flag && args[a + 1] == value) {
      return true;
    }
  }
  return false;
}
}  // namespace

TEST_CASE("Plain sessions run a login shell", "[CommandBuilder]") {
  CommandBuilder builder(testConfig());
  SpawnRequest request;
  request.sessionId = "s1";
  request.cwd = "/tmp";
  request.prompt = "ignored";
  request.permissionProfile = PermissionProfile::PLAIN;

  CommandSelection selection = builder.build(request);
  REQUIRE(selection.launch.command == "/bin/zsh");
  REQUIRE(selection.launch.args == vector<string>({"-l"}));
  REQUIRE(selection.launch.cwd == "/tmp");
  REQUIRE(selection.launch.cols == 100);
  REQUIRE(selection.launch.rows == 30);
  REQUIRE(!selection.sendPromptAfterSpawn);
}

TEST_CASE("Agent profiles", "[CommandBuilder]") {
  CommandBuilder builder(testConfig());
  SpawnRequest request;
  request.sessionId = "s1";
  request.cwd = "/work";
  request.prompt = "fix the bug";
  request.agentSessionId = "agent-1";

  SECTION("Auto passes the prompt on the command line") {
    request.permissionProfile = PermissionProfile::AUTO;
    request.allowedTools = "Read,Edit";
    CommandSelection selection = builder.build(request);
    REQUIRE(selection.launch.command == "agent");
    REQUIRE(hasPair(selection.launch.args, "-p", "fix the bug"));
    REQUIRE(hasPair(selection.launch.args, "--allowedTools", "Read,Edit"));
    REQUIRE(hasPair(selection.launch.args, "--session-id", "agent-1"));
    REQUIRE(!selection.sendPromptAfterSpawn);
  }

  SECTION("Yolo skips confirmations") {
    request.permissionProfile = PermissionProfile::YOLO;
    CommandSelection selection = builder.build(request);
    const auto& args = selection.launch.args;
    REQUIRE(std::find(args.begin(), args.end(),
                      "--dangerously-skip-permissions") != args.end());
    REQUIRE(hasPair(args, "-p", "fix the bug"));
  }

  SECTION("Interactive types the prompt in later") {
    request.permissionProfile = PermissionProfile::INTERACTIVE;
    CommandSelection selection = builder.build(request);
    const auto& args = selection.launch.args;
    REQUIRE(std::find(args.begin(), args.end(), "fix the bug") == args.end());
    REQUIRE(selection.sendPromptAfterSpawn);
    REQUIRE(hasPair(args, "--session-id", "agent-1"));
  }

  SECTION("Interactive without a prompt sends nothing") {
    request.permissionProfile = PermissionProfile::INTERACTIVE;
    request.prompt = "";
    REQUIRE(!builder.build(request).sendPromptAfterSpawn);
  }

  SECTION("Resume continues an earlier conversation") {
    request.resumeSessionId = "old-conversation";
    CommandSelection selection = builder.build(request);
    const auto& args = selection.launch.args;
    REQUIRE(hasPair(args, "--resume", "old-conversation"));
    REQUIRE(args.back() == "fix the bug");
    REQUIRE(std::find(args.begin(), args.end(), "--session-id") == args.end());
  }
}

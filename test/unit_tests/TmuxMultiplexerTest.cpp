#include "TmuxMultiplexer.hpp"

#include "TestHeaders.hpp"

using namespace tether;

namespace {
/** @brief Records tmux invocations and answers with canned results. */
class RecordingSubprocessUtils : public SubprocessUtils {
 public:
  RecordingSubprocessUtils() : nextExitCode(0) {}

  virtual SubprocessResult run(const string& command,
                               const vector<string>& args, int64_t) {
    calls.push_back(make_pair(command, args));
    SubprocessResult result;
    result.exitCode = nextExitCode;
    result.output = nextOutput;
    return result;
  }

  int nextExitCode;
  string nextOutput;
  vector<pair<string, vector<string>>> calls;
};

SupervisorConfig tmuxConfig() {
  SupervisorConfig config;
  config.tmuxSocket = "test-sock";
  config.tmuxPrefix = "tw-";
  return config;
}

bool contains(const vector<string>& args, const string& word) {
  return std::find(args.begin(), args.end(), word) != args.end();
}
}  // namespace

TEST_CASE("Shell quoting", "[TmuxMultiplexer]") {
  REQUIRE(TmuxMultiplexer::shellQuote("plain") == "plain");
  REQUIRE(TmuxMultiplexer::shellQuote("") == "''");
  REQUIRE(TmuxMultiplexer::shellQuote("two words") == "'two words'");
  REQUIRE(TmuxMultiplexer::shellQuote("it's") == "'it'\\''s'");
  REQUIRE(TmuxMultiplexer::shellCommand("agent", {"-p", "fix $HOME"}) ==
          "agent -p 'fix $HOME'");
}

TEST_CASE("tmux commands use the dedicated socket", "[TmuxMultiplexer]") {
  auto utils = make_shared<RecordingSubprocessUtils>();
  TmuxMultiplexer tmux(tmuxConfig(), utils);

  LaunchSpec launch;
  launch.command = "agent";
  launch.args = {"-p", "hello"};
  launch.cwd = "/work";
  launch.cols = 90;
  launch.rows = 25;
  launch.environment["TERM"] = "xterm-256color";
  tmux.createSession("s1", launch);

  REQUIRE(utils->calls.size() == 1);
  const auto& args = utils->calls[0].second;
  REQUIRE(utils->calls[0].first == "tmux");
  REQUIRE(args[0] == "-L");
  REQUIRE(args[1] == "test-sock");
  REQUIRE(contains(args, "new-session"));
  REQUIRE(contains(args, "tw-s1"));
  REQUIRE(contains(args, "90"));
  REQUIRE(contains(args, "25"));
  REQUIRE(contains(args, "/work"));
  REQUIRE(contains(args, "TERM=xterm-256color"));
  REQUIRE(args.back() == "agent -p hello; echo $? > " + GetTempDirectory() +
                             "tether-exit-s1");

  LaunchSpec attach = tmux.attachCommand("s1", 80, 24);
  REQUIRE(attach.command == "tmux");
  REQUIRE(attach.args == vector<string>({"-L", "test-sock", "attach-session",
                                         "-t", "tw-s1"}));
  REQUIRE(attach.cols == 80);
}

TEST_CASE("Long commands go through a launcher script", "[TmuxMultiplexer]") {
  auto utils = make_shared<RecordingSubprocessUtils>();
  TmuxMultiplexer tmux(tmuxConfig(), utils);

  LaunchSpec launch;
  launch.command = "agent";
  launch.args = {"-p", string(2000, 'p')};
  launch.cwd = "/work";
  tmux.createSession("long", launch);

  string script = utils->calls[0].second.back();
  REQUIRE(script.size() < TmuxMultiplexer::COMMAND_LENGTH_LIMIT);
  ifstream in(script);
  REQUIRE(in.good());
  string contents((std::istreambuf_iterator<char>(in)),
                  std::istreambuf_iterator<char>());
  REQUIRE(contents.find("agent -p ") != string::npos);
  REQUIRE(contents.find(string(2000, 'p')) != string::npos);
  REQUIRE(contents.find("echo $? > ") != string::npos);

  tmux.killSession("long");
  REQUIRE(!fs::exists(script));
}

TEST_CASE("tmux failures are reported", "[TmuxMultiplexer]") {
  auto utils = make_shared<RecordingSubprocessUtils>();
  TmuxMultiplexer tmux(tmuxConfig(), utils);
  utils->nextExitCode = 1;

  LaunchSpec launch;
  launch.command = "agent";
  REQUIRE_THROWS_AS(tmux.createSession("s1", launch), std::runtime_error);
  REQUIRE(!tmux.hasSession("s1"));
  REQUIRE(!tmux.capturePane("s1"));
  REQUIRE(tmux.listSessions().empty());
}

TEST_CASE("Listing keeps only our sessions", "[TmuxMultiplexer]") {
  auto utils = make_shared<RecordingSubprocessUtils>();
  TmuxMultiplexer tmux(tmuxConfig(), utils);
  utils->nextOutput = "tw-a\nother\ntw-b\ntw-\n";

  auto ids = tmux.listSessions();
  REQUIRE(ids == vector<string>({"a", "b"}));
}

TEST_CASE("Availability is probed once", "[TmuxMultiplexer]") {
  auto utils = make_shared<RecordingSubprocessUtils>();
  TmuxMultiplexer tmux(tmuxConfig(), utils);

  REQUIRE(tmux.isAvailable());
  REQUIRE(tmux.isAvailable());
  REQUIRE(utils->calls.size() == 1);
  REQUIRE(utils->calls[0].second == vector<string>({"-V"}));
}

TEST_CASE("Reaping reads the recorded exit code and removes leftovers",
          "[TmuxMultiplexer]") {
  auto utils = make_shared<RecordingSubprocessUtils>();
  TmuxMultiplexer tmux(tmuxConfig(), utils);

  LaunchSpec launch;
  launch.command = "agent";
  launch.args = {"-p", string(2000, 'p')};
  tmux.createSession("reaped", launch);
  string script = utils->calls[0].second.back();
  REQUIRE(fs::exists(script));

  // What the command line writes when the agent exits
  string statusPath = GetTempDirectory() + "tether-exit-reaped";
  {
    ofstream out(statusPath);
    out << "3\n";
  }

  optional<int> exitCode = tmux.reapSession("reaped");
  REQUIRE(exitCode);
  REQUIRE(*exitCode == 3);
  REQUIRE(!fs::exists(script));
  REQUIRE(!fs::exists(statusPath));

  // Nothing recorded the second time around
  REQUIRE(!tmux.reapSession("reaped"));
}

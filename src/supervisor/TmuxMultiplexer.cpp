#include "TmuxMultiplexer.hpp"

namespace tether {
TmuxMultiplexer::TmuxMultiplexer(const SupervisorConfig& config,
                                 shared_ptr<SubprocessUtils> _subprocessUtils)
    : subprocessUtils(_subprocessUtils),
      socketName(config.tmuxSocket),
      prefix(config.tmuxPrefix),
      configFile(config.tmuxConfig),
      timeoutMs(config.subprocessTimeoutMs) {}

SubprocessResult TmuxMultiplexer::tmux(const vector<string>& args) {
  vector<string> fullArgs = {"-L", socketName};
  fullArgs.insert(fullArgs.end(), args.begin(), args.end());
  return subprocessUtils->run("tmux", fullArgs, timeoutMs);
}

bool TmuxMultiplexer::isAvailable() {
  lock_guard<mutex> guard(availableMutex);
  if (!available) {
    try {
      available = subprocessUtils->run("tmux", {"-V"}, timeoutMs).ok();
    } catch (const SubprocessTimeout& st) {
      LOG(WARNING) << "tmux probe failed: " << st.what();
      available = false;
    }
    LOG(INFO) << "tmux available: " << (*available ? "yes" : "no");
  }
  return *available;
}

string TmuxMultiplexer::shellQuote(const string& word) {
  if (word.empty()) {
    return "''";
  }
  if (word.find_first_of(" '\"\\$\n\t`;&|<>()*?!#~") == string::npos) {
    return word;
  }
  string quoted = word;
  replaceAll(quoted, "'", "'\\''");
  return "'" + quoted + "'";
}

string TmuxMultiplexer::shellCommand(const string& command,
                                     const vector<string>& args) {
  string line = shellQuote(command);
  for (const auto& arg : args) {
    line += " " + shellQuote(arg);
  }
  return line;
}

string TmuxMultiplexer::launcherPath(const string& sessionId) {
  return GetTempDirectory() + "tether-launch-" + sessionId + ".sh";
}

string TmuxMultiplexer::exitStatusPath(const string& sessionId) {
  return GetTempDirectory() + "tether-exit-" + sessionId;
}

void TmuxMultiplexer::createSession(const string& sessionId,
                                    const LaunchSpec& launch) {
  string command = shellCommand(launch.command, launch.args);
  string recordExit = "echo $? > " + shellQuote(exitStatusPath(sessionId));
  ::unlink(exitStatusPath(sessionId).c_str());
  optional<string> scriptPath;
  if (command.size() + recordExit.size() + 2 > COMMAND_LENGTH_LIMIT) {
    scriptPath = launcherPath(sessionId);
    {
      ofstream script(*scriptPath, ios::out | ios::trunc);
      script << "#!/bin/sh\n"
             << "cd " << shellQuote(launch.cwd) << "\n"
             << command << "\n"
             << recordExit << "\n";
      if (!script) {
        throw std::runtime_error("Could not write launcher script " +
                                 *scriptPath);
      }
    }
    FATAL_FAIL(::chmod(scriptPath->c_str(), S_IRWXU));
    VLOG(1) << "Command for " << sessionId << " is " << command.size()
            << " bytes, using launcher " << *scriptPath;
    command = shellQuote(*scriptPath);
  } else {
    command += "; " + recordExit;
  }

  vector<string> args;
  if (!configFile.empty()) {
    args.push_back("-f");
    args.push_back(configFile);
  }
  vector<string> newSession = {"new-session", "-d",
                               "-s",          nameFor(sessionId),
                               "-x",          to_string(launch.cols),
                               "-y",          to_string(launch.rows)};
  args.insert(args.end(), newSession.begin(), newSession.end());
  if (!launch.cwd.empty()) {
    args.push_back("-c");
    args.push_back(launch.cwd);
  }
  for (const auto& it : launch.environment) {
    args.push_back("-e");
    args.push_back(it.first + "=" + it.second);
  }
  args.push_back(command);

  SubprocessResult result;
  try {
    result = tmux(args);
  } catch (const SubprocessTimeout&) {
    if (scriptPath) ::unlink(scriptPath->c_str());
    throw;
  }
  if (!result.ok()) {
    if (scriptPath) ::unlink(scriptPath->c_str());
    throw std::runtime_error("tmux new-session failed for " + sessionId +
                             " with exit code " + to_string(result.exitCode));
  }
  LOG(INFO) << "Created tmux session " << nameFor(sessionId);
}

LaunchSpec TmuxMultiplexer::attachCommand(const string& sessionId, int cols,
                                          int rows) {
  LaunchSpec launch;
  launch.command = "tmux";
  launch.args = {"-L", socketName, "attach-session", "-t", nameFor(sessionId)};
  launch.cols = cols;
  launch.rows = rows;
  return launch;
}

bool TmuxMultiplexer::hasSession(const string& sessionId) {
  return tmux({"has-session", "-t", nameFor(sessionId)}).ok();
}

bool TmuxMultiplexer::killSession(const string& sessionId) {
  bool killed = tmux({"kill-session", "-t", nameFor(sessionId)}).ok();
  reapSession(sessionId);
  return killed;
}

optional<int> TmuxMultiplexer::reapSession(const string& sessionId) {
  ::unlink(launcherPath(sessionId).c_str());
  string statusPath = exitStatusPath(sessionId);
  optional<int> exitCode;
  {
    ifstream in(statusPath);
    int code;
    if (in >> code) {
      exitCode = code;
    }
  }
  ::unlink(statusPath.c_str());
  VLOG(1) << "Reaped tmux session of " << sessionId << ", exit code "
          << (exitCode ? to_string(*exitCode) : string("unknown"));
  return exitCode;
}

optional<string> TmuxMultiplexer::capturePane(const string& sessionId) {
  SubprocessResult result =
      tmux({"capture-pane", "-t", nameFor(sessionId), "-p", "-S", "-"});
  if (!result.ok()) {
    return nullopt;
  }
  return result.output;
}

vector<string> TmuxMultiplexer::listSessions() {
  vector<string> sessionIds;
  SubprocessResult result = tmux({"list-sessions", "-F", "#{session_name}"});
  if (!result.ok()) {
    // No server running means no sessions
    return sessionIds;
  }
  for (const auto& name : split(result.output, '\n')) {
    if (name.size() > prefix.size() && name.compare(0, prefix.size(), prefix) == 0) {
      sessionIds.push_back(name.substr(prefix.size()));
    }
  }
  return sessionIds;
}

void TmuxMultiplexer::detachClients(const string& sessionId) {
  SubprocessResult result = tmux({"detach-client", "-s", nameFor(sessionId)});
  if (!result.ok()) {
    VLOG(1) << "detach-client for " << sessionId << " exited with "
            << result.exitCode;
  }
}
}  // namespace tether

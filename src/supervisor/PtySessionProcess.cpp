#include "PtySessionProcess.hpp"

namespace tether {
namespace {
const int64_t KILL_ESCALATION_MS = 5000;
}

PtySessionProcess::PtySessionProcess()
    : pid(-1), masterFd(-1), terminated(false) {}

PtySessionProcess::~PtySessionProcess() { cleanup(); }

void PtySessionProcess::start(const LaunchSpec& launch) {
  winsize win;
  memset(&win, 0, sizeof(winsize));
  win.ws_col = launch.cols;
  win.ws_row = launch.rows;

  pid = forkpty(&masterFd, NULL, NULL, &win);
  switch (pid) {
    case -1: {
      auto localErrno = GetErrno();
      throw std::runtime_error(string("forkpty failed: ") +
                               strerror(localErrno));
    }
    case 0: {
      runChild(launch);
      // Only reached when exec failed
      _exit(127);
    }
    default: {
      // parent
      break;
    }
  }
  FATAL_FAIL(fcntl(masterFd, F_SETFD, FD_CLOEXEC));

#ifdef WITH_UTEMPTER
  {
    char buf[1024];
    snprintf(buf, sizeof(buf), "tether [%lld]", (long long)pid);
    utempter_add_record(masterFd, buf);
  }
#endif
  LOG(INFO) << "Started " << launch.command << " as pid " << pid;
}

void PtySessionProcess::runChild(const LaunchSpec& launch) {
  if (!launch.cwd.empty() && ::chdir(launch.cwd.c_str()) != 0) {
    fprintf(stderr, "tether: cannot chdir to %s: %s\n", launch.cwd.c_str(),
            strerror(errno));
    _exit(126);
  }
  setenv("TERM", "xterm-256color", 1);
  setenv("TETHER_VERSION", TETHER_VERSION, 1);
  for (const auto& it : launch.environment) {
    setenv(it.first.c_str(), it.second.c_str(), 1);
  }
  // The supervisor may ignore SIGCHLD/SIGPIPE, children should not inherit it
  signal(SIGCHLD, SIG_DFL);
  signal(SIGPIPE, SIG_DFL);

  vector<char*> argv;
  argv.push_back(strdup(launch.command.c_str()));
  for (const auto& arg : launch.args) {
    argv.push_back(strdup(arg.c_str()));
  }
  argv.push_back(NULL);
  execvp(launch.command.c_str(), &argv[0]);
  fprintf(stderr, "tether: cannot execute %s: %s\n", launch.command.c_str(),
          strerror(errno));
}

void PtySessionProcess::write(const string& data) {
  lock_guard<mutex> guard(fdMutex);
  if (masterFd < 0) {
    VLOG(1) << "Dropping write to closed pty of " << pid;
    return;
  }
  size_t pos = 0;
  while (pos < data.size()) {
    ssize_t rc = ::write(masterFd, data.data() + pos, data.size() - pos);
    if (rc < 0) {
      if (errno == EINTR || errno == EAGAIN) {
        continue;
      }
      VLOG(1) << "Write to pty " << pid << " failed: " << strerror(errno);
      return;
    }
    pos += rc;
  }
}

void PtySessionProcess::resize(int cols, int rows) {
  winsize win;
  memset(&win, 0, sizeof(winsize));
  win.ws_col = cols;
  win.ws_row = rows;
  lock_guard<mutex> guard(fdMutex);
  if (masterFd < 0) {
    return;
  }
  if (ioctl(masterFd, TIOCSWINSZ, &win) < 0) {
    VLOG(1) << "Resize of pty " << pid << " failed: " << strerror(errno);
  }
}

void PtySessionProcess::terminate() {
  lock_guard<mutex> guard(processMutex);
  if (pid <= 0 || exitCode) {
    return;
  }
  terminated = true;
  ::kill(pid, SIGHUP);
}

int PtySessionProcess::waitForExit() {
  {
    lock_guard<mutex> guard(processMutex);
    if (exitCode) {
      return *exitCode;
    }
  }
  optional<Clock::time_point> escalateAt;
  bool killed = false;
  while (true) {
    int status = 0;
    pid_t rc = ::waitpid(pid, &status, WNOHANG);
    if (rc == pid) {
      lock_guard<mutex> guard(processMutex);
      if (WIFEXITED(status)) {
        exitCode = WEXITSTATUS(status);
      } else if (WIFSIGNALED(status)) {
        exitCode = 128 + WTERMSIG(status);
      } else {
        exitCode = -1;
      }
      VLOG(1) << "Process " << pid << " exited with " << *exitCode;
      return *exitCode;
    }
    if (rc < 0 && errno != EINTR) {
      // Somebody else reaped it
      lock_guard<mutex> guard(processMutex);
      exitCode = -1;
      return -1;
    }
    {
      lock_guard<mutex> guard(processMutex);
      if (terminated && !escalateAt) {
        escalateAt = Clock::now() + std::chrono::milliseconds(KILL_ESCALATION_MS);
      }
    }
    if (escalateAt && !killed && Clock::now() > *escalateAt) {
      LOG(WARNING) << "Process " << pid << " ignored SIGHUP, sending SIGKILL";
      ::kill(pid, SIGKILL);
      killed = true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
}

void PtySessionProcess::cleanup() {
  lock_guard<mutex> guard(fdMutex);
  if (masterFd < 0) {
    return;
  }
#ifdef WITH_UTEMPTER
  utempter_remove_record(masterFd);
#endif
  ::close(masterFd);
  masterFd = -1;
}
}  // namespace tether

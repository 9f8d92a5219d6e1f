#include "SubprocessUtils.hpp"

namespace tether {
SubprocessResult SubprocessUtils::run(const string& command,
                                      const vector<string>& args,
                                      int64_t timeoutMs) {
  int link_client[2];
  char buf_client[4096];
  FATAL_FAIL(pipe(link_client));

  pid_t pid = fork();
  if (pid == 0) {
    // child process
    dup2(link_client[1], STDOUT_FILENO);
    int devNull = ::open("/dev/null", O_WRONLY);
    if (devNull >= 0) {
      dup2(devNull, STDERR_FILENO);
      ::close(devNull);
    }
    ::close(link_client[0]);
    ::close(link_client[1]);

    char** argsArray = new char*[args.size() + 2];
    argsArray[0] = strdup(command.c_str());
    for (size_t a = 0; a < args.size(); a++) {
      argsArray[a + 1] = strdup(args[a].c_str());
    }
    argsArray[args.size() + 1] = NULL;
    execvp(command.c_str(), argsArray);
    _exit(127);
  }
  if (pid < 0) {
    auto localErrno = GetErrno();
    ::close(link_client[0]);
    ::close(link_client[1]);
    throw std::runtime_error(string("Failed to fork: ") +
                             strerror(localErrno));
  }

  // parent process
  ::close(link_client[1]);
  auto start = Clock::now();
  string childOutput;
  bool timedOut = false;
  while (true) {
    int64_t remaining = timeoutMs - millisSince(start);
    if (remaining <= 0) {
      timedOut = true;
      break;
    }
    pollfd pfd;
    pfd.fd = link_client[0];
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = ::poll(&pfd, 1, int(min<int64_t>(remaining, 100)));
    if (ready < 0 && errno != EINTR) {
      break;
    }
    if (ready <= 0) {
      continue;
    }
    ssize_t nbytes = ::read(link_client[0], buf_client, sizeof(buf_client));
    if (nbytes <= 0) {
      break;
    }
    childOutput.append(buf_client, nbytes);
  }
  ::close(link_client[0]);

  if (timedOut) {
    ::kill(pid, SIGKILL);
    ::waitpid(pid, NULL, 0);
    LOG(WARNING) << "Subprocess " << command << " timed out after "
                 << timeoutMs << "ms";
    throw SubprocessTimeout(command);
  }

  // stdout is closed; the child is exiting or already gone
  int status = 0;
  while (true) {
    pid_t result = ::waitpid(pid, &status, WNOHANG);
    if (result == pid) {
      break;
    }
    if (result < 0 && errno != EINTR) {
      status = 0;
      break;
    }
    if (millisSince(start) > timeoutMs) {
      ::kill(pid, SIGKILL);
      ::waitpid(pid, NULL, 0);
      throw SubprocessTimeout(command);
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }

  SubprocessResult result;
  result.output = childOutput;
  if (WIFEXITED(status)) {
    result.exitCode = WEXITSTATUS(status);
  } else {
    result.exitCode = -1;
  }
  VLOG(2) << "Subprocess " << command << " exited with " << result.exitCode;
  return result;
}
}  // namespace tether

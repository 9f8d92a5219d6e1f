#ifndef __TETHER_FAKE_SESSION_PROCESS__
#define __TETHER_FAKE_SESSION_PROCESS__

#include "SessionProcess.hpp"

namespace tether {
/**
 * @brief SessionProcess backed by a pipe: the test writes "terminal output"
 * with emit() and ends the process with exit().
 */
class FakeSessionProcess : public SessionProcess {
 public:
  FakeSessionProcess()
      : readFd(-1),
        writeFd(-1),
        exitCode(0),
        exited(false),
        terminated(false),
        failStart(false) {}
  virtual ~FakeSessionProcess() {
    closeWriteEnd();
    cleanup();
  }

  virtual void start(const LaunchSpec& _launch) {
    if (failStart) {
      throw std::runtime_error("Fake process refused to start");
    }
    launch = _launch;
    int fds[2];
    FATAL_FAIL(::pipe(fds));
    readFd = fds[0];
    writeFd = fds[1];
    int opts = fcntl(readFd, F_GETFL);
    FATAL_FAIL(fcntl(readFd, F_SETFL, opts | O_NONBLOCK));
  }
  virtual int getFd() { return readFd; }
  virtual pid_t getPid() { return 4242; }
  virtual void write(const string& data) {
    lock_guard<mutex> guard(processMutex);
    writes.push_back(data);
  }
  virtual void resize(int cols, int rows) {
    lock_guard<mutex> guard(processMutex);
    resizes.push_back(make_pair(cols, rows));
  }
  virtual void terminate() {
    lock_guard<mutex> guard(processMutex);
    terminated = true;
    exitCondition.notify_all();
  }
  virtual int waitForExit() {
    unique_lock<mutex> lock(processMutex);
    exitCondition.wait(lock, [this]() { return exited || terminated; });
    return exited ? exitCode : 128 + SIGHUP;
  }
  virtual void cleanup() {
    lock_guard<mutex> guard(processMutex);
    if (readFd >= 0) {
      ::close(readFd);
      readFd = -1;
    }
  }

  /** @brief Makes the process print data. */
  void emit(const string& data) {
    size_t pos = 0;
    while (pos < data.size()) {
      ssize_t rc = ::write(writeFd, data.data() + pos, data.size() - pos);
      if (rc < 0) {
        if (errno == EINTR || errno == EAGAIN) continue;
        FATAL_FAIL(rc);
      }
      pos += rc;
    }
  }

  /** @brief Ends the process; the supervisor sees EOF. */
  void exit(int code) {
    {
      lock_guard<mutex> guard(processMutex);
      exitCode = code;
      exited = true;
      exitCondition.notify_all();
    }
    closeWriteEnd();
  }

  vector<string> getWrites() {
    lock_guard<mutex> guard(processMutex);
    return writes;
  }
  vector<pair<int, int>> getResizes() {
    lock_guard<mutex> guard(processMutex);
    return resizes;
  }
  bool wasTerminated() {
    lock_guard<mutex> guard(processMutex);
    return terminated;
  }

  LaunchSpec launch;
  int readFd;
  int writeFd;
  int exitCode;
  bool exited;
  bool terminated;
  bool failStart;

 protected:
  void closeWriteEnd() {
    if (writeFd >= 0) {
      ::close(writeFd);
      writeFd = -1;
    }
  }

  mutex processMutex;
  condition_variable exitCondition;
  vector<string> writes;
  vector<pair<int, int>> resizes;
};

class FakeProcessFactory : public ProcessFactory {
 public:
  FakeProcessFactory() : failNext(false) {}

  virtual shared_ptr<SessionProcess> create() {
    auto process = make_shared<FakeSessionProcess>();
    lock_guard<mutex> guard(factoryMutex);
    if (failNext) {
      process->failStart = true;
      failNext = false;
    }
    created.push_back(process);
    return process;
  }

  shared_ptr<FakeSessionProcess> last() {
    lock_guard<mutex> guard(factoryMutex);
    return created.empty() ? nullptr : created.back();
  }
  size_t count() {
    lock_guard<mutex> guard(factoryMutex);
    return created.size();
  }

  bool failNext;

 protected:
  mutex factoryMutex;
  vector<shared_ptr<FakeSessionProcess>> created;
};
}  // namespace tether

#endif  // __TETHER_FAKE_SESSION_PROCESS__

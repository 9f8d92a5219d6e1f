#ifndef __TETHER_PTY_SESSION_PROCESS__
#define __TETHER_PTY_SESSION_PROCESS__

#include "SessionProcess.hpp"

namespace tether {
/**
 * @brief A process running on the slave side of a pseudo terminal created
 * with forkpty.
 */
class PtySessionProcess : public SessionProcess {
 public:
  PtySessionProcess();
  virtual ~PtySessionProcess();

  virtual void start(const LaunchSpec& launch);
  virtual int getFd() { return masterFd; }
  virtual pid_t getPid() { return pid; }
  virtual void write(const string& data);
  virtual void resize(int cols, int rows);
  virtual void terminate();
  virtual int waitForExit();
  virtual void cleanup();

 protected:
  void runChild(const LaunchSpec& launch);

  pid_t pid;
  int masterFd;
  bool terminated;
  optional<int> exitCode;
  mutex processMutex;
  // Guards masterFd once the process is running; a closed fd number can be
  // reused by the next socket
  mutex fdMutex;
};

class PtyProcessFactory : public ProcessFactory {
 public:
  virtual shared_ptr<SessionProcess> create() {
    return make_shared<PtySessionProcess>();
  }
};
}  // namespace tether

#endif  // __TETHER_PTY_SESSION_PROCESS__

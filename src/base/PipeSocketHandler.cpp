#include "PipeSocketHandler.hpp"

namespace tether {
PipeSocketHandler::PipeSocketHandler() {}

bool PipeSocketHandler::waitForData(int fd, int64_t timeoutMs) {
  pollfd pfd;
  pfd.fd = fd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int n = ::poll(&pfd, 1, int(timeoutMs));
  if (n <= 0) {
    return false;
  }
  // Hangups count as readable so the caller sees the EOF
  return (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

ssize_t PipeSocketHandler::read(int fd, void* buf, size_t count) {
  {
    lock_guard<recursive_mutex> guard(globalMutex);
    if (activeSockets.find(fd) == activeSockets.end()) {
      VLOG(1) << "Tried to read from a socket that has been closed: " << fd;
      errno = EPIPE;
      return -1;
    }
  }
  ssize_t readBytes = ::read(fd, buf, count);
  auto localErrno = errno;
  if (readBytes < 0 && localErrno != EAGAIN && localErrno != EWOULDBLOCK) {
    LOG(WARNING) << "Error reading: " << localErrno << " "
                 << strerror(localErrno);
  }
  errno = localErrno;
  return readBytes;
}

ssize_t PipeSocketHandler::write(int fd, const void* buf, size_t count) {
  {
    lock_guard<recursive_mutex> guard(globalMutex);
    if (activeSockets.find(fd) == activeSockets.end()) {
      VLOG(1) << "Tried to write to a socket that has been closed: " << fd;
      errno = EPIPE;
      return -1;
    }
  }
  return ::send(fd, buf, count, MSG_NOSIGNAL | MSG_DONTWAIT);
}

int PipeSocketHandler::connect(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  sockaddr_un remote;
  memset(&remote, 0, sizeof(sockaddr_un));

  int sockFd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(sockFd);
  remote.sun_family = AF_UNIX;
  strncpy(remote.sun_path, pipePath.c_str(), sizeof(remote.sun_path) - 1);

  VLOG(3) << "Connecting to " << pipePath << " with fd " << sockFd;
  // UNIX sockets connect (or fail) immediately, so connect before switching
  // to non-blocking mode.
  int result =
      ::connect(sockFd, (struct sockaddr*)&remote, sizeof(sockaddr_un));
  if (result < 0) {
    auto localErrno = GetErrno();
    LOG(INFO) << "Error connecting to " << pipePath << ": " << localErrno
              << " " << strerror(localErrno);
    FATAL_FAIL(::close(sockFd));
    SetErrno(localErrno);
    return -1;
  }
  initSocket(sockFd);
  activeSockets.insert(sockFd);
  VLOG(1) << "Connected to endpoint " << pipePath << " on fd " << sockFd;
  return sockFd;
}

set<int> PipeSocketHandler::listen(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  if (pipeServerSockets.find(pipePath) != pipeServerSockets.end()) {
    throw runtime_error("Tried to listen twice on the same path");
  }

  sockaddr_un local;
  memset(&local, 0, sizeof(sockaddr_un));

  int fd = ::socket(AF_UNIX, SOCK_STREAM, 0);
  FATAL_FAIL(fd);
  initSocket(fd);
  local.sun_family = AF_UNIX;
  strncpy(local.sun_path, pipePath.c_str(), sizeof(local.sun_path) - 1);
  unlink(local.sun_path);

  FATAL_FAIL(::bind(fd, (struct sockaddr*)&local, sizeof(sockaddr_un)));
  FATAL_FAIL(::listen(fd, 64));
  FATAL_FAIL(::chmod(local.sun_path, S_IRUSR | S_IWUSR | S_IXUSR));

  pipeServerSockets[pipePath] = fd;
  return set<int>({fd});
}

int PipeSocketHandler::accept(int sockFd) {
  int clientFd = ::accept(sockFd, NULL, NULL);
  auto acceptErrno = errno;
  if (clientFd < 0) {
    if (acceptErrno != EAGAIN && acceptErrno != EWOULDBLOCK &&
        acceptErrno != EINTR) {
      LOG(WARNING) << "accept failed: " << strerror(acceptErrno);
    }
    errno = acceptErrno;
    return -1;
  }
  lock_guard<recursive_mutex> guard(globalMutex);
  initSocket(clientFd);
  activeSockets.insert(clientFd);
  VLOG(3) << "Socket " << sockFd << " accepted " << clientFd;
  return clientFd;
}

void PipeSocketHandler::stopListening(const SocketEndpoint& endpoint) {
  lock_guard<recursive_mutex> guard(globalMutex);

  string pipePath = endpoint.name();
  auto it = pipeServerSockets.find(pipePath);
  if (it == pipeServerSockets.end()) {
    STFATAL << "Tried to stop listening to a pipe that we weren't listening on:"
            << pipePath;
  }
  FATAL_FAIL(::close(it->second));
  pipeServerSockets.erase(it);
  unlink(pipePath.c_str());
}

void PipeSocketHandler::close(int fd) {
  lock_guard<recursive_mutex> guard(globalMutex);
  if (fd == -1) {
    return;
  }
  auto it = activeSockets.find(fd);
  if (it == activeSockets.end()) {
    // Connection was already closed
    VLOG(1) << "Tried to close a connection that doesn't exist: " << fd;
    return;
  }
  VLOG(1) << "Closing connection: " << fd;
  ::shutdown(fd, SHUT_RDWR);
  FATAL_FAIL(::close(fd));
  activeSockets.erase(it);
}

void PipeSocketHandler::initSocket(int fd) {
  int opts = fcntl(fd, F_GETFL);
  FATAL_FAIL(opts);
  opts |= O_NONBLOCK;
  FATAL_FAIL(fcntl(fd, F_SETFL, opts));
  FATAL_FAIL(fcntl(fd, F_SETFD, FD_CLOEXEC));
}
}  // namespace tether

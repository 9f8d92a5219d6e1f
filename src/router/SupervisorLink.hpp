#ifndef __TETHER_SUPERVISOR_LINK__
#define __TETHER_SUPERVISOR_LINK__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Control channel from the router to the local supervisor.
 */
class SupervisorLink {
 public:
  enum class KillResult { KILLED, NOT_ACTIVE, UNREACHABLE };

  virtual ~SupervisorLink() {}

  /**
   * @brief The supervisor's own set of active session ids.
   * @return nullopt when the supervisor could not be asked. That means the
   * liveness of every local session is unknown, not that none is alive.
   */
  virtual optional<set<string>> activeSessionIds() = 0;

  virtual KillResult killSession(const string& sessionId) = 0;
};

/** @brief SupervisorLink over the supervisor's HTTP control API. */
class HttpSupervisorLink : public SupervisorLink {
 public:
  HttpSupervisorLink(const string& _host, int _port, int64_t _timeoutMs);
  virtual ~HttpSupervisorLink() {}

  virtual optional<set<string>> activeSessionIds();
  virtual KillResult killSession(const string& sessionId);

 protected:
  unique_ptr<httplib::Client> makeClient();

  string host;
  int port;
  int64_t timeoutMs;
};
}  // namespace tether

#endif  // __TETHER_SUPERVISOR_LINK__

#ifndef __TETHER_SUPERVISOR_HTTP_API__
#define __TETHER_SUPERVISOR_HTTP_API__

#include "Headers.hpp"
#include "JsonLib.hpp"
#include "ProcessSupervisor.hpp"
#include "SessionStore.hpp"

namespace tether {
/**
 * @brief HTTP control API of the supervisor (spawn, kill, input, status and
 * the authoritative set of active sessions).
 */
class SupervisorHttpApi {
 public:
  SupervisorHttpApi(shared_ptr<ProcessSupervisor> _supervisor,
                    shared_ptr<SessionStore> _store);
  virtual ~SupervisorHttpApi();

  /**
   * @brief Binds and serves on a background thread.
   * @throws std::runtime_error when the address cannot be bound.
   */
  void start(const string& host, int port);
  void stop();

  /**
   * @brief Parses a spawn body.
   * @throws std::runtime_error when sessionId or cwd are missing.
   */
  static SpawnRequest spawnRequestFromJson(const json& body);

  void handleSpawn(const httplib::Request& req, httplib::Response& res);
  void handleKill(const string& sessionId, httplib::Response& res);
  void handleResize(const string& sessionId, const httplib::Request& req,
                    httplib::Response& res);
  void handleInput(const string& sessionId, const httplib::Request& req,
                   httplib::Response& res);
  void handleStatus(const string& sessionId, httplib::Response& res);
  void handleHealth(httplib::Response& res);
  void handleWaiting(httplib::Response& res);

 protected:
  static void reply(httplib::Response& res, int status, const json& body);
  static void replyError(httplib::Response& res, int status,
                         const string& error);

  shared_ptr<ProcessSupervisor> supervisor;
  shared_ptr<SessionStore> store;
  httplib::Server server;
  shared_ptr<thread> serverThread;
};
}  // namespace tether

#endif  // __TETHER_SUPERVISOR_HTTP_API__

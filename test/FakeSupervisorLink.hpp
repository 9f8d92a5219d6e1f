#ifndef __TETHER_FAKE_SUPERVISOR_LINK__
#define __TETHER_FAKE_SUPERVISOR_LINK__

#include "SupervisorLink.hpp"

namespace tether {
class FakeSupervisorLink : public SupervisorLink {
 public:
  FakeSupervisorLink() : killResult(KillResult::NOT_ACTIVE) {}

  virtual optional<set<string>> activeSessionIds() { return active; }
  virtual KillResult killSession(const string& sessionId) {
    killRequests.push_back(sessionId);
    return killResult;
  }

  // nullopt simulates an unreachable supervisor
  optional<set<string>> active;
  KillResult killResult;
  vector<string> killRequests;
};
}  // namespace tether

#endif  // __TETHER_FAKE_SUPERVISOR_LINK__

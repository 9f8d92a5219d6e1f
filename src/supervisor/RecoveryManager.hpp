#ifndef __TETHER_RECOVERY_MANAGER__
#define __TETHER_RECOVERY_MANAGER__

#include "Headers.hpp"
#include "SessionStore.hpp"
#include "SubprocessUtils.hpp"
#include "SupervisorConfig.hpp"
#include "TerminalMultiplexer.hpp"

namespace tether {
class ProcessSupervisor;

/**
 * @brief Reattaches to multiplexed sessions that outlived a supervisor
 * restart.
 */
class RecoveryManager {
 public:
  RecoveryManager(ProcessSupervisor* _supervisor,
                  shared_ptr<SessionStore> _store,
                  shared_ptr<TerminalMultiplexer> _multiplexer,
                  const SupervisorConfig& _config);
  virtual ~RecoveryManager() {}

  enum class Outcome {
    // The session has a process handle
    RECOVERED,
    // Nothing left to reattach to
    GONE,
    // The multiplexer did not answer in time; try again later
    UNREACHABLE
  };

  /**
   * @brief Reattaches to the multiplexed session of a record if it is still
   * alive, seeding the new handle with the captured scrollback.
   */
  virtual Outcome tryRecover(const SessionRecord& record);

  /**
   * @brief Startup pass over the store: recovers running records, marks the
   * unrecoverable ones failed, and reopens failed records whose multiplexed
   * session turns out to be alive. Records the multiplexer could not answer
   * for are left running.
   * @return Number of recovered sessions.
   */
  int recoverAll();

 protected:
  void markStale(const string& sessionId);

  ProcessSupervisor* supervisor;
  shared_ptr<SessionStore> store;
  shared_ptr<TerminalMultiplexer> multiplexer;
  SupervisorConfig config;
  // Serializes recoveries so two viewers cannot race to reattach
  recursive_mutex recoveryMutex;
};
}  // namespace tether

#endif  // __TETHER_RECOVERY_MANAGER__

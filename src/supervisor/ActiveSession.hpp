#ifndef __TETHER_ACTIVE_SESSION__
#define __TETHER_ACTIVE_SESSION__

#include "Headers.hpp"
#include "PacketChannel.hpp"
#include "SessionProcess.hpp"
#include "SessionTypes.hpp"
#include "SupervisorConfig.hpp"
#include "WaitingStateDetector.hpp"

namespace tether {
/**
 * @brief In-memory handle of one running session. At most one exists per
 * session id.
 *
 * Everything below handleMutex is guarded by it; the session thread, the
 * viewer threads and the control API all go through that lock.
 */
struct ActiveSession {
  ActiveSession(const string& _id, shared_ptr<SessionProcess> _process,
                const SupervisorConfig& config)
      : id(_id),
        process(_process),
        profile(PermissionProfile::INTERACTIVE),
        totalBytes(0),
        outputSeq(0),
        lastAckedInputSeq(0),
        status(SessionStatus::RUNNING),
        detector(config.waitingClearVisibleBytes, config.waitingGraceMs),
        hasStarted(false),
        lastFlush(Clock::now()) {}

  const string id;
  const shared_ptr<SessionProcess> process;
  PermissionProfile profile;
  optional<string> multiplexName;

  mutex handleMutex;
  // Most recent output, capped at max_output_log bytes
  string outputBuffer;
  int64_t totalBytes;
  int64_t outputSeq;
  int64_t lastAckedInputSeq;
  set<shared_ptr<PacketChannel>> viewers;
  SessionStatus status;
  WaitingStateDetector detector;
  // Set once the process produced output
  bool hasStarted;

  // Prompt typed in once an interactive agent looks ready
  optional<string> pendingPrompt;
  string promptProbe;
  optional<Clock::time_point> promptReadyAt;
  Clock::time_point promptDeadline;

  optional<Clock::time_point> healthDeadline;
  Clock::time_point lastFlush;
};
}  // namespace tether

#endif  // __TETHER_ACTIVE_SESSION__

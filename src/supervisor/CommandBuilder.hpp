#ifndef __TETHER_COMMAND_BUILDER__
#define __TETHER_COMMAND_BUILDER__

#include "SessionProcess.hpp"
#include "SessionTypes.hpp"
#include "SupervisorConfig.hpp"

namespace tether {
/** @brief The command for a spawn and whether the prompt is typed in later. */
struct CommandSelection {
  LaunchSpec launch;
  bool sendPromptAfterSpawn = false;
};

/**
 * @brief Maps a spawn request to the executable and arguments that run it.
 */
class CommandBuilder {
 public:
  explicit CommandBuilder(const SupervisorConfig& _config) : config(_config) {}

  CommandSelection build(const SpawnRequest& request) const;

 protected:
  SupervisorConfig config;
};
}  // namespace tether

#endif  // __TETHER_COMMAND_BUILDER__

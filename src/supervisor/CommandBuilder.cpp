#include "CommandBuilder.hpp"

namespace tether {
CommandSelection CommandBuilder::build(const SpawnRequest& request) const {
  CommandSelection selection;
  LaunchSpec& launch = selection.launch;
  launch.cwd = request.cwd;
  launch.cols = config.defaultCols;
  launch.rows = config.defaultRows;

  if (request.permissionProfile == PermissionProfile::PLAIN) {
    launch.command = config.shell;
    launch.args = {"-l"};
    return selection;
  }

  launch.command = config.agentBinary;
  vector<string>& args = launch.args;
  if (!request.resumeSessionId.empty()) {
    args.push_back("--resume");
    args.push_back(request.resumeSessionId);
    if (!request.prompt.empty()) {
      args.push_back(request.prompt);
    }
    return selection;
  }

  switch (request.permissionProfile) {
    case PermissionProfile::AUTO:
      args = {"-p", request.prompt, "--output-format", "stream-json",
              "--verbose"};
      if (!request.allowedTools.empty()) {
        args.push_back("--allowedTools");
        args.push_back(request.allowedTools);
      }
      break;
    case PermissionProfile::YOLO:
      args = {"-p",
              request.prompt,
              "--dangerously-skip-permissions",
              "--output-format",
              "stream-json",
              "--verbose"};
      break;
    default:
      if (!request.allowedTools.empty()) {
        args.push_back("--allowedTools");
        args.push_back(request.allowedTools);
      }
      selection.sendPromptAfterSpawn = !request.prompt.empty();
      break;
  }
  if (!request.agentSessionId.empty()) {
    args.push_back("--session-id");
    args.push_back(request.agentSessionId);
  }
  return selection;
}
}  // namespace tether

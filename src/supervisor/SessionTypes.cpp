#include "SessionTypes.hpp"

namespace tether {
string sessionStatusToString(SessionStatus status) {
  switch (status) {
    case SessionStatus::PENDING:
      return "pending";
    case SessionStatus::RUNNING:
      return "running";
    case SessionStatus::COMPLETED:
      return "completed";
    case SessionStatus::FAILED:
      return "failed";
    case SessionStatus::KILLED:
      return "killed";
  }
  STFATAL << "Invalid session status: " << int(status);
  return "";
}

SessionStatus sessionStatusFromString(const string& s) {
  if (s == "pending") return SessionStatus::PENDING;
  if (s == "running") return SessionStatus::RUNNING;
  if (s == "completed") return SessionStatus::COMPLETED;
  if (s == "failed") return SessionStatus::FAILED;
  if (s == "killed") return SessionStatus::KILLED;
  throw std::runtime_error("Unknown session status: " + s);
}

string permissionProfileToString(PermissionProfile profile) {
  switch (profile) {
    case PermissionProfile::INTERACTIVE:
      return "interactive";
    case PermissionProfile::AUTO:
      return "auto";
    case PermissionProfile::YOLO:
      return "yolo";
    case PermissionProfile::PLAIN:
      return "plain";
  }
  STFATAL << "Invalid permission profile: " << int(profile);
  return "";
}

PermissionProfile permissionProfileFromString(const string& s) {
  if (s == "auto") return PermissionProfile::AUTO;
  if (s == "yolo") return PermissionProfile::YOLO;
  if (s == "plain") return PermissionProfile::PLAIN;
  return PermissionProfile::INTERACTIVE;
}
}  // namespace tether

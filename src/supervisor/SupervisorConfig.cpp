#include "SupervisorConfig.hpp"

#include "SimpleIni.h"

namespace tether {
namespace {
void readInt(const CSimpleIniA& ini, const char* section, const char* key,
             int64_t* value) {
  const char* s = ini.GetValue(section, key, NULL);
  if (!s) {
    return;
  }
  size_t parsed = 0;
  try {
    *value = stoll(s, &parsed);
  } catch (const std::logic_error&) {
    parsed = 0;
  }
  if (parsed == 0 || s[parsed] != '\0') {
    throw std::runtime_error(string("Invalid number for ") + section + "." +
                             key + ": " + s);
  }
}

void readString(const CSimpleIniA& ini, const char* section, const char* key,
                string* value) {
  const char* s = ini.GetValue(section, key, NULL);
  if (s) {
    *value = string(s);
  }
}
}  // namespace

SupervisorConfig::SupervisorConfig() {
  const char* envShell = ::getenv("SHELL");
  shell = (envShell && *envShell) ? string(envShell) : string("/bin/bash");
}

void SupervisorConfig::loadFromIni(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  readInt(ini, "Session", "max_output_log", &maxOutputLog);
  readInt(ini, "Session", "flush_interval_ms", &flushIntervalMs);
  readInt(ini, "Session", "subprocess_timeout_ms", &subprocessTimeoutMs);
  readInt(ini, "Session", "prompt_send_timeout_ms", &promptSendTimeoutMs);
  readString(ini, "Session", "agent_binary", &agentBinary);
  readString(ini, "Session", "shell", &shell);
  int64_t cols = defaultCols;
  int64_t rows = defaultRows;
  readInt(ini, "Session", "default_cols", &cols);
  readInt(ini, "Session", "default_rows", &rows);
  if (cols <= 0 || rows <= 0) {
    throw std::runtime_error("Terminal size must be positive");
  }
  defaultCols = int(cols);
  defaultRows = int(rows);

  readInt(ini, "Heuristics", "health_check_delay_ms", &healthCheckDelayMs);
  readInt(ini, "Heuristics", "health_visible_threshold",
          &healthVisibleThreshold);
  readInt(ini, "Heuristics", "waiting_clear_visible_bytes",
          &waitingClearVisibleBytes);
  readInt(ini, "Heuristics", "waiting_grace_ms", &waitingGraceMs);
  readInt(ini, "Heuristics", "recovery_grace_ms", &recoveryGraceMs);

  readInt(ini, "Ledger", "ledger_max_entries", &ledgerMaxEntries);
  readInt(ini, "Ledger", "ledger_ttl_ms", &ledgerTtlMs);
  readInt(ini, "Ledger", "viewer_buffer_bytes", &viewerBufferBytes);

  readString(ini, "Tmux", "tmux_socket", &tmuxSocket);
  readString(ini, "Tmux", "tmux_prefix", &tmuxPrefix);
  readString(ini, "Tmux", "tmux_config", &tmuxConfig);
}
}  // namespace tether

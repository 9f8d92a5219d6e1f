#include "OutputHeuristics.hpp"

namespace tether {
namespace {
const char ESC = '\x1b';
const int PROMPT_SCAN_LINES = 15;

const vector<string> CONFIRMATION_PHRASES = {
    "Do you want to", "(y/n)",    "[y/N]",       "[Y/n]",
    "Allow",          "Proceed?", "Press Enter", "❯ 1. Yes",
};

const vector<string> STARTUP_MARKERS = {
    "Welcome", "? for shortcuts", "Type your", "Claude", "╭", "$ ", ">",
};

inline bool isVisible(unsigned char c) { return c >= 0x20 && c != 0x7f; }
}  // namespace

ScanResult AnsiScanner::scan(const string& chunk) {
  ScanResult result;
  for (char ch : chunk) {
    unsigned char c = static_cast<unsigned char>(ch);
    switch (state) {
      case State::NORMAL:
        if (ch == ESC) {
          state = State::ESCAPE;
        } else if (ch == BELL) {
          result.sawBell = true;
          result.visibleBytesAfterBell = 0;
        } else if (isVisible(c)) {
          result.visibleBytes++;
          result.visibleBytesAfterBell++;
        }
        break;
      case State::ESCAPE:
        if (ch == '[') {
          state = State::CSI;
        } else if (ch == ']' || ch == 'P' || ch == 'X' || ch == '^' ||
                   ch == '_') {
          // OSC, DCS, SOS, PM and APC all run until a string terminator
          state = State::STRING;
        } else if (ch == ESC) {
          state = State::ESCAPE;
        } else {
          state = State::NORMAL;
        }
        break;
      case State::CSI:
        if (c >= 0x40 && c <= 0x7e) {
          state = State::NORMAL;
        } else if (ch == ESC) {
          state = State::ESCAPE;
        }
        break;
      case State::STRING:
        if (ch == BELL) {
          state = State::NORMAL;
        } else if (ch == ESC) {
          state = State::STRING_ESCAPE;
        }
        break;
      case State::STRING_ESCAPE:
        if (ch == '\\') {
          state = State::NORMAL;
        } else if (ch != ESC) {
          state = State::STRING;
        }
        break;
    }
  }
  return result;
}

int64_t countVisibleBytes(const string& output) {
  AnsiScanner scanner;
  return scanner.scan(output).visibleBytes;
}

string stripAnsi(const string& output) {
  // Reuse the scanner one byte at a time so both agree on what is visible
  AnsiScanner scanner;
  string stripped;
  stripped.reserve(output.size());
  for (char ch : output) {
    string one(1, ch);
    ScanResult r = scanner.scan(one);
    if (r.visibleBytes > 0 || ch == '\n') {
      stripped.push_back(ch);
    }
  }
  return stripped;
}

bool looksLikeInteractivePrompt(const string& screen) {
  vector<string> lines = split(stripAnsi(screen), '\n');
  int checked = 0;
  for (auto it = lines.rbegin();
       it != lines.rend() && checked < PROMPT_SCAN_LINES; ++it) {
    if (it->find_first_not_of(" \t\r") == string::npos) {
      continue;
    }
    checked++;
    for (const auto& phrase : CONFIRMATION_PHRASES) {
      if (it->find(phrase) != string::npos) {
        return true;
      }
    }
  }
  return false;
}

bool isStartupHealthy(const string& output, int64_t visibleThreshold) {
  if (countVisibleBytes(output) > visibleThreshold) {
    return true;
  }
  string text = stripAnsi(output);
  for (const auto& marker : STARTUP_MARKERS) {
    if (text.find(marker) != string::npos) {
      return true;
    }
  }
  return false;
}

bool looksReadyForPrompt(const string& output) {
  return output.find('>') != string::npos ||
         output.find("Type your") != string::npos || output.size() > 500;
}
}  // namespace tether

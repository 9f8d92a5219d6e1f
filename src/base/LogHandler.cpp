#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace tether {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts, not from easylogging's own argv parsing
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // %thread prints the name given with el::Helpers::setThreadName
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

namespace {
// <prefix>[-stderr]-YYYY-mm-dd_HH-MM-SS[_pid].log
string logFileName(const string &prefix, const string &kind,
                   const string &timestamp, bool appendPid) {
  string name = prefix;
  if (!kind.empty()) {
    name += "-" + kind;
  }
  name += "-" + timestamp;
  if (appendPid) {
    name += "_" + std::to_string(getpid());
  }
  return name + ".log";
}

string fileTimestamp() {
  time_t rawtime = time(NULL);
  struct tm timeinfo;
  localtime_r(&rawtime, &timeinfo);
  char buffer[80];
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &timeinfo);
  return string(buffer);
}
}  // namespace

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &path, const string &filenamePrefix,
                               bool logToStdout, bool redirectStderrToFile,
                               bool appendPid, const string &maxlogsize) {
  string timestamp = fileTimestamp();
  string logPath = createLogFile(
      path, logFileName(filenamePrefix, "", timestamp, appendPid));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, logPath);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");

  // <prefix>-latest.log always points at the file of the running daemon
  string latest = path + "/" + filenamePrefix + "-latest.log";
  std::error_code ec;
  fs::remove(latest, ec);
  fs::create_symlink(logPath, latest, ec);
  if (ec) {
    CLOG(WARNING, "stdout") << "Could not link " << latest << ": "
                            << ec.message() << endl;
  }

  if (redirectStderrToFile) {
    stderrToFile(path,
                 logFileName(filenamePrefix, "stderr", timestamp, appendPid));
  }
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here, so nothing may be logged
  std::remove(filename);
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

void LogHandler::applyVerbosity(int cliLevel, const char *configLevel) {
  if (cliLevel > 0) {
    el::Loggers::setVerboseLevel(cliLevel);
  } else if (configLevel) {
    el::Loggers::setVerboseLevel(atoi(configLevel));
  }
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    CLOG(ERROR, "stdout") << "Cannot create log directory " << path << ": "
                          << ec.message() << endl;
    exit(1);
  }
  string logPath = path + "/" + filename;
  // Refuse to follow a planted symlink or reuse an existing file
  int fd = ::open(logPath.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return logPath;
}

void LogHandler::stderrToFile(const string &path,
                              const string &stderrFilename) {
  string stderrPath = createLogFile(path, stderrFilename);
  FILE *stream = freopen(stderrPath.c_str(), "w", stderr);
  if (!stream) {
    STFATAL << "Cannot redirect stderr to " << stderrPath;
  }
  setvbuf(stream, NULL, _IOLBF, BUFSIZ);
}

}  // namespace tether

#ifndef __TETHER_LOG_HANDLER__
#define __TETHER_LOG_HANDLER__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Configures easylogging++ for the tether daemons and tests.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sets up file-based logging, optionally writing stderr to disk.
   * @param defaultConf Base easylogging configuration that will be mutated.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            bool redirectStderrToFile = false,
                            bool appendPid = false,
                            const string &maxlogsize = "20971520");

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the `stdout` logger so it just writes messages.
   */
  static void setupStdoutLogger();

  /**
   * @brief Applies the verbosity from the command line, or from the config
   * file when the command line did not set one.
   */
  static void applyVerbosity(int cliLevel, const char *configLevel);

 private:
  static void stderrToFile(const string &path, const string &stderrFilename);

  static string createLogFile(const string &path, const string &filename);
};
}  // namespace tether
#endif  // __TETHER_LOG_HANDLER__

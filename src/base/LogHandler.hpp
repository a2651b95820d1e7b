#ifndef __TSM_LOG_HANDLER__
#define __TSM_LOG_HANDLER__

#include "Headers.hpp"

namespace tsm {
/**
 * @brief Configures easylogging++ for the session manager and its hosts.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Sends the default logger to a fresh file under `path`.
   * @param defaultConf Base easylogging configuration that will be mutated.
   * @param appendPid Suffix the file name with the pid, for concurrent hosts.
   */
  static void setupLogFiles(el::Configurations *defaultConf, const string &path,
                            const string &filenamePrefix,
                            bool logToStdout = false, bool appendPid = false,
                            const string &maxlogsize = "20971520");

  /**
   * @brief Performs log rotation by removing the supplied filename.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Reconfigures the "stdout" logger so it just writes messages.
   */
  static void setupStdoutLogger();

 private:
  /**
   * @brief Ensures the directory exists and creates a new log file.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace tsm
#endif  // __TSM_LOG_HANDLER__

#ifndef __TETHER_LOG_HANDLER__
#define __TETHER_LOG_HANDLER__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Configures easylogging++ for the daemon and the test runner.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Points the default logger at a fresh file under `directory`.
   * @param maxlogsize Rollover threshold in bytes, as easylogging expects.
   */
  static void setupLogFiles(el::Configurations *defaultConf,
                            const string &directory,
                            const string &filenamePrefix,
                            bool logToStdout = false,
                            const string &maxlogsize = "20971520");

  /**
   * @brief Performs log rotation, keeping the full file as `<name>.1`.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /**
   * @brief Deletes all but the newest `keep` log files written with
   * `filenamePrefix`, rotated backups included.
   * @return The number of files removed.
   */
  static int pruneLogFiles(const string &directory,
                           const string &filenamePrefix, int keep);

  /**
   * @brief Reconfigures the `stdout` logger so it just writes messages.
   *
   * The daemon uses it for protocol output, so nothing else may be mixed in.
   */
  static void setupStdoutLogger();

 private:
  static string createLogFile(const string &directory, const string &filename);
};
}  // namespace tether
#endif  // __TETHER_LOG_HANDLER__

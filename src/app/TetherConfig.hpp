#ifndef __TETHER_CONFIG__
#define __TETHER_CONFIG__

#include <cxxopts.hpp>

#include "Headers.hpp"

namespace tether {
/**
 * @brief Daemon settings.  Command line beats the config file, which beats
 * the defaults below.
 */
struct TetherConfig {
  // [Storage]
  string dataDir;
  // [Terminal]
  string shell;
  // [Chat]
  string completionCommand = "claude";
  int64_t completionTimeoutMs = 30 * 1000;
  int maxConcurrentCompletions = 4;
  // [Debug]
  int verbose = 0;
  bool silent = false;
  bool logToStdout = false;
  // default max log file size is 20MB
  string maxLogSize = "20971520";

  string databasePath() const { return dataDir + "/tether.db"; }
  string logDir() const { return dataDir + "/logs"; }
};

/** @brief `$HOME/.tether`, or a directory under the temp dir without HOME. */
string defaultDataDir();

/** @brief Registers the daemon's command line options. */
void addCommandLineOptions(cxxopts::Options *options);

/**
 * @brief Overlays an INI file onto `config`.
 * @throws std::runtime_error if the file cannot be parsed.
 */
void loadConfigFile(const string &filename, TetherConfig *config);

/** @brief Overlays the options that were given on the command line. */
void applyCommandLine(const cxxopts::ParseResult &result,
                      TetherConfig *config);

/** @brief Defaults, then `--cfgfile` if given, then the command line. */
TetherConfig resolveConfig(const cxxopts::ParseResult &result);
}  // namespace tether

#endif  // __TETHER_CONFIG__

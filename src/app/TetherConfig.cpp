#include "TetherConfig.hpp"

#include "SimpleIni.h"

namespace tether {
string defaultDataDir() {
  const char *home = ::getenv("HOME");
  if (home && *home) {
    return string(home) + "/.tether";
  }
  return GetTempDirectory() + "tether";
}

void addCommandLineOptions(cxxopts::Options *options) {
  options->add_options()            //
      ("h,help", "Print help")      //
      ("version", "Print version")  //
      ("cfgfile", "Location of the config file",
       cxxopts::value<std::string>()->default_value(""))  //
      ("datadir", "Directory for the database, snapshot and logs",
       cxxopts::value<std::string>())  //
      ("shell", "Shell to run in terminal sessions",
       cxxopts::value<std::string>())  //
      ("completion-cli", "Command that streams chat completions",
       cxxopts::value<std::string>())  //
      ("logtostdout", "log to stdout")  //
      ("v,verbose", "Enable verbose logging",
       cxxopts::value<int>()->default_value("0"), "LEVEL")  //
      ;
}

void loadConfigFile(const string &filename, TetherConfig *config) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(filename.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + filename);
  }

  const char *dataDir = ini.GetValue("Storage", "datadir", NULL);
  if (dataDir && *dataDir) {
    config->dataDir = dataDir;
  }

  const char *shell = ini.GetValue("Terminal", "shell", NULL);
  if (shell && *shell) {
    config->shell = shell;
  }

  const char *command = ini.GetValue("Chat", "command", NULL);
  if (command && *command) {
    config->completionCommand = command;
  }
  config->completionTimeoutMs = ini.GetLongValue(
      "Chat", "event_timeout_ms", long(config->completionTimeoutMs));
  config->maxConcurrentCompletions = int(ini.GetLongValue(
      "Chat", "max_concurrent", config->maxConcurrentCompletions));

  config->verbose =
      int(ini.GetLongValue("Debug", "verbose", config->verbose));
  config->silent = ini.GetBoolValue("Debug", "silent", config->silent);
  // make sure maxLogSize is a string of int value
  const char *logsize = ini.GetValue("Debug", "logsize", NULL);
  if (logsize && atoi(logsize) != 0) {
    config->maxLogSize = string(logsize);
  }
}

void applyCommandLine(const cxxopts::ParseResult &result,
                      TetherConfig *config) {
  if (result.count("datadir")) {
    config->dataDir = result["datadir"].as<string>();
  }
  if (result.count("shell")) {
    config->shell = result["shell"].as<string>();
  }
  if (result.count("completion-cli")) {
    config->completionCommand = result["completion-cli"].as<string>();
  }
  if (result.count("verbose")) {
    config->verbose = result["verbose"].as<int>();
  }
  if (result.count("logtostdout")) {
    config->logToStdout = true;
  }
}

TetherConfig resolveConfig(const cxxopts::ParseResult &result) {
  TetherConfig config;
  config.dataDir = defaultDataDir();
  string cfgfile = result["cfgfile"].as<string>();
  if (!cfgfile.empty()) {
    loadConfigFile(cfgfile, &config);
  }
  applyCommandLine(result, &config);
  if (config.maxConcurrentCompletions < 1) {
    config.maxConcurrentCompletions = 1;
  }
  return config;
}
}  // namespace tether

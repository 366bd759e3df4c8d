#define CATCH_CONFIG_RUNNER

#include <cstring>

#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace tether;

int main(int argc, char **argv) {
  srand(1);

  bool listOnly = false;
  for (int i = 1; i < argc; ++i) {
    if (strcmp(argv[i], "--list-tests") == 0 || strcmp(argv[i], "-l") == 0) {
      listOnly = true;
      break;
    }
  }

  // Setup easylogging configurations
  el::Configurations defaultConf =
      tether::LogHandler::setupLogHandler(&argc, &argv);
  tether::LogHandler::setupStdoutLogger();
  // el::Loggers::setVerboseLevel(9);

  tether::HandleTerminate();

  string logDirectoryPattern =
      GetTempDirectory() + string("tether_test_XXXXXXXX");
  string logDirectory = string(mkdtemp(&logDirectoryPattern[0]));
  if (!listOnly) {
    CLOG(INFO, "stdout") << "Writing log to " << logDirectory << endl;
  }
  tether::LogHandler::setupLogFiles(&defaultConf, logDirectory, "log");

  // Reconfigure default logger to apply settings above
  el::Loggers::reconfigureLogger("default", defaultConf);

  int result = Catch::Session().run(argc, argv);

  FATAL_FAIL(fs::remove_all(logDirectory.c_str()));
  return result;
}

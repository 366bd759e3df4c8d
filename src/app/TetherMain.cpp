#include <cxxopts.hpp>

#include "CliCompletionBackend.hpp"
#include "DirectoryReader.hpp"
#include "EffectScheduler.hpp"
#include "LogHandler.hpp"
#include "ProjectKey.hpp"
#include "PseudoTerminalProcess.hpp"
#include "RecordStore.hpp"
#include "SessionRegistry.hpp"
#include "SnapshotStore.hpp"
#include "Store.hpp"
#include "TetherConfig.hpp"

using namespace tether;

namespace {
// Log files from earlier runs that are kept in the data directory.
const int MAX_LOG_FILES = 10;

void writeLine(const json &message) {
  CLOG(INFO, "stdout") << dumpJson(message);
}

json resultLine(const DispatchResult &result) {
  json line = result.toJson();
  line["type"] = "result";
  return line;
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tether::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tether::InterruptSignalHandler);

  cxxopts::Options options("tetherd",
                           "State engine for multi-project workspaces");
  try {
    addCommandLineOptions(&options);
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({});
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tetherd version " << TETHER_VERSION;
      exit(0);
    }

    TetherConfig config;
    try {
      config = resolveConfig(result);
    } catch (const std::runtime_error &ex) {
      STFATAL << ex.what();
    }

    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }
    LogHandler::setupLogFiles(&defaultConf, config.logDir(), "tetherd",
                              config.logToStdout, config.maxLogSize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    el::Helpers::setThreadName("tetherd-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
    LogHandler::pruneLogFiles(config.logDir(), "tetherd", MAX_LOG_FILES);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    LOG(INFO) << "Starting tetherd with data directory " << config.dataDir;
    fs::create_directories(config.dataDir);

    StoreDependencies deps;
    deps.recordStore.reset(new RecordStore(config.databasePath()));
    // One recovery file per data directory.
    deps.snapshotStore.reset(new SnapshotStore(
        config.dataDir, hashToHex(normalizePath(config.dataDir))));
    deps.directoryReader.reset(new FsDirectoryReader());
    deps.registry.reset(new SessionRegistry(
        [] { return unique_ptr<PtyProcess>(new PseudoTerminalProcess()); },
        config.shell.empty() ? SessionRegistry::defaultShell()
                             : config.shell));
    deps.scheduler.reset(new EffectScheduler(
        shared_ptr<CompletionBackend>(new CliCompletionBackend(
            config.completionCommand, config.completionTimeoutMs)),
        config.maxConcurrentCompletions));

    AppState initialState;
    auto recovered = deps.snapshotStore->load();
    if (recovered) {
      LOG(INFO) << "Recovered state at version " << recovered->version;
      initialState = *recovered;
    }

    Store store(deps, initialState);
    auto unsubscribe =
        store.subscribe([](const string &snapshot, int64_t version) {
          json line;
          line["type"] = "state";
          line["version"] = version;
          line["state"] = json::parse(snapshot);
          writeLine(line);
        });

    string input;
    while (std::getline(std::cin, input)) {
      if (input.find_first_not_of(" \t\r") == string::npos) {
        continue;
      }
      writeLine(resultLine(store.dispatchJson(input)));
    }

    LOG(INFO) << "Input closed, shutting down";
    store.waitForIdle();
    unsubscribe();
    store.shutdown();
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n";
    CLOG(INFO, "stdout") << options.help({});
    exit(1);
  } catch (const TetherException &ex) {
    STFATAL << "Could not start tetherd: " << ex.what();
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}

#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace tether {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // easylogging parses verbose arguments itself, but the daemon sets the
  // verbosity explicitly from cxxopts / the config file afterwards.
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations defaultConf;
  defaultConf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  defaultConf.setGlobally(el::ConfigurationType::Format,
                          "[%level %datetime %thread %fbase:%line] %msg");
  defaultConf.setGlobally(el::ConfigurationType::Enabled, "true");
  defaultConf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  defaultConf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  defaultConf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  // Protocol output goes to stdout, so the default logger stays off it.
  defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput, "false");
  defaultConf.set(el::Level::Verbose, el::ConfigurationType::Format,
                  "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return defaultConf;
}

void LogHandler::setupLogFiles(el::Configurations *defaultConf,
                               const string &directory,
                               const string &filenamePrefix, bool logToStdout,
                               const string &maxlogsize) {
  time_t rawtime;
  struct tm *timeinfo;
  char buffer[80];
  time(&rawtime);
  timeinfo = localtime(&rawtime);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", timeinfo);
  string logFilename = filenamePrefix + "-" + string(buffer) + "_" +
                       std::to_string(getpid()) + ".log";
  string fullFname = createLogFile(directory, logFilename);

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize, maxlogsize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           logToStdout ? "true" : "false");
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here, so nothing may be logged.  One previous
  // generation is kept next to the live file.
  string backup = string(filename) + ".1";
  if (::rename(filename, backup.c_str()) == -1) {
    ::remove(filename);
  }
}

int LogHandler::pruneLogFiles(const string &directory,
                              const string &filenamePrefix, int keep) {
  std::error_code ec;
  vector<string> names;
  for (fs::directory_iterator it(directory, ec), end; !ec && it != end;
       it.increment(ec)) {
    string name = it->path().filename().string();
    if (name.rfind(filenamePrefix + "-", 0) == 0 &&
        name.find(".log") != string::npos) {
      names.push_back(name);
    }
  }
  if (ec) {
    LOG(WARNING) << "Cannot list log directory " << directory << ": "
                 << ec.message();
    return 0;
  }
  // Names start with the creation time, so they sort oldest first.
  std::sort(names.begin(), names.end());
  int removed = 0;
  for (int a = 0; a + keep < int(names.size()); a++) {
    fs::path stale = fs::path(directory) / names[a];
    if (fs::remove(stale, ec)) {
      removed++;
    } else if (ec) {
      LOG(WARNING) << "Cannot remove old log " << stale << ": "
                   << ec.message();
    }
  }
  VLOG(1) << "Pruned " << removed << " old log files from " << directory;
  return removed;
}

void LogHandler::setupStdoutLogger() {
  el::Logger *stdoutLogger = el::Loggers::getLogger("stdout");
  el::Configurations stdoutConf;
  stdoutConf.setToDefault();
  // Values are always std::string
  stdoutConf.setGlobally(el::ConfigurationType::Format, "%msg");
  stdoutConf.setGlobally(el::ConfigurationType::ToStandardOutput, "true");
  stdoutConf.setGlobally(el::ConfigurationType::ToFile, "false");
  el::Loggers::reconfigureLogger(stdoutLogger, stdoutConf);
}

string LogHandler::createLogFile(const string &directory,
                                 const string &filename) {
  string fullFname = directory + "/" + filename;
  try {
    fs::create_directories(directory);
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory: " << fse.what()
                          << endl;
    exit(1);
  }
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}
}  // namespace tether

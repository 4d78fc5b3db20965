#include "LogHandler.hpp"

INITIALIZE_EASYLOGGINGPP

namespace archtui {
el::Configurations LogHandler::setupLogHandler(int *argc, char ***argv) {
  // Verbosity comes from cxxopts / the config file, not from easylogging's
  // own argument parsing
  START_EASYLOGGINGPP(*argc, *argv);

  el::Configurations conf;
  conf.setToDefault();
  // doc says %thread_name, but %thread is the right one
  conf.setGlobally(el::ConfigurationType::Format,
                   "[%level %datetime %thread %fbase:%line] %msg");
  conf.setGlobally(el::ConfigurationType::Enabled, "true");
  conf.setGlobally(el::ConfigurationType::SubsecondPrecision, "3");
  conf.setGlobally(el::ConfigurationType::PerformanceTracking, "false");
  conf.setGlobally(el::ConfigurationType::LogFlushThreshold, "1");
  conf.set(el::Level::Verbose, el::ConfigurationType::Format,
           "[%levshort%vlevel %datetime %thread %fbase:%line] %msg");
  return conf;
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

string LogHandler::configureLogging(el::Configurations *defaultConf,
                                    const LogSettings &settings) {
  string fullFname =
      createLogFile(settings.directory, logFilename(settings, ""));

  el::Loggers::addFlag(el::LoggingFlag::StrictLogFileSizeCheck);
  defaultConf->setGlobally(el::ConfigurationType::Filename, fullFname);
  defaultConf->setGlobally(el::ConfigurationType::ToFile, "true");
  defaultConf->setGlobally(el::ConfigurationType::MaxLogFileSize,
                           settings.maxLogSize);
  defaultConf->setGlobally(el::ConfigurationType::ToStandardOutput,
                           settings.logToStdout ? "true" : "false");
  if (settings.silent) {
    defaultConf->setGlobally(el::ConfigurationType::Enabled, "false");
  }
  el::Loggers::reconfigureLogger("default", *defaultConf);
  el::Loggers::setVerboseLevel(settings.verbose);
  el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

  if (settings.redirectStderr) {
    redirectStderr(createLogFile(settings.directory,
                                 logFilename(settings, "stderr")));
  }
  return fullFname;
}

void LogHandler::shutdown() {
  el::Loggers::flushAll();
  el::Helpers::uninstallPreRollOutCallback();
}

void LogHandler::rolloutHandler(const char *filename, std::size_t size) {
  // The log file is closed here, so nothing may be logged
  string rotated = string(filename) + ".1";
  if (::rename(filename, rotated.c_str()) == -1) {
    ::remove(filename);
  }
}

string LogHandler::logFilename(const LogSettings &settings,
                               const string &kind) {
  time_t rawtime;
  char buffer[80];
  time(&rawtime);
  struct tm timeinfo;
  localtime_r(&rawtime, &timeinfo);
  strftime(buffer, sizeof(buffer), "%Y-%m-%d_%H-%M-%S", &timeinfo);

  string filename = settings.filenamePrefix;
  if (!kind.empty()) {
    filename += "-" + kind;
  }
  filename += string("-") + buffer;
  if (settings.appendPid) {
    filename += "_" + to_string(getpid());
  }
  return filename + ".log";
}

string LogHandler::createLogFile(const string &path, const string &filename) {
  try {
    if (fs::create_directories(path)) {
      fs::permissions(path, fs::perms::owner_all);
    }
  } catch (const fs::filesystem_error &fse) {
    CLOG(ERROR, "stdout") << "Cannot create log directory: " << fse.what()
                          << endl;
    exit(1);
  }
  string fullFname = (fs::path(path) / filename).string();
  int fd = ::open(fullFname.c_str(), O_NOFOLLOW | O_EXCL | O_CREAT, 0600);
  FATAL_FAIL(fd);
  ::close(fd);
  return fullFname;
}

void LogHandler::redirectStderr(const string &fullFname) {
  FILE *stderrStream = freopen(fullFname.c_str(), "w", stderr);
  if (!stderrStream) {
    STFATAL << "Cannot redirect stderr to " << fullFname;
  }
  setvbuf(stderrStream, NULL, _IOLBF, BUFSIZ);
}
}  // namespace archtui

#ifndef __ARCHTUI_LOG_HANDLER__
#define __ARCHTUI_LOG_HANDLER__

#include "Headers.hpp"

namespace archtui {
/**
 * @brief Where and how the default logger writes.
 */
struct LogSettings {
  string directory;
  string filenamePrefix = "archtui";
  /** @brief Mirror the log to stdout (only sensible when headless). */
  bool logToStdout = false;
  /**
   * @brief Send this process' stderr to a file so stray writes cannot
   * corrupt the painted console.
   */
  bool redirectStderr = false;
  bool appendPid = true;
  string maxLogSize = "20971520";
  int verbose = 0;
  bool silent = false;
};

/**
 * @brief Configures easylogging++ for the dashboard and its tests.
 *
 * The dashboard owns the real terminal while a tool is running, so the
 * default logger goes to a file and only the "stdout" logger is allowed to
 * print, and only before the console switches to raw mode.
 */
class LogHandler {
 public:
  /**
   * @brief Initializes logging using the supplied `argc/argv` parameters.
   * @return A default configuration that callers can further customize.
   */
  static el::Configurations setupLogHandler(int *argc, char ***argv);

  /**
   * @brief Reconfigures the easylogging stdout logger so it just writes
   * messages.
   */
  static void setupStdoutLogger();

  /**
   * @brief Creates the log file described by `settings`, applies it to the
   * default logger and installs the roll-out callback.
   * @return Full path of the log file.
   */
  static string configureLogging(el::Configurations *defaultConf,
                                 const LogSettings &settings);

  /** @brief Flushes every logger and removes the roll-out callback. */
  static void shutdown();

  /**
   * @brief Keeps one rotated copy (`<file>.1`) when the log reaches its
   * maximum size.
   */
  static void rolloutHandler(const char *filename, std::size_t size);

  /** @brief `<prefix>[-<kind>]-<timestamp>[_<pid>].log` */
  static string logFilename(const LogSettings &settings, const string &kind);

 private:
  static void redirectStderr(const string &fullFname);

  /**
   * @brief Ensures the directory exists (mode 0700 when created) and creates
   * a new, empty log file that must not exist yet.
   */
  static string createLogFile(const string &path, const string &filename);
};
}  // namespace archtui
#endif  // __ARCHTUI_LOG_HANDLER__

#ifndef __ARCHTUI_DASHBOARD_CONFIG__
#define __ARCHTUI_DASHBOARD_CONFIG__

#include "Headers.hpp"

namespace archtui {
/**
 * @brief Settings read from the optional INI config file.
 *
 * @code
 * [Logging]
 * verbose=0
 * logdir=/tmp/archtui
 * logsize=20971520
 * silent=0
 *
 * [Terminal]
 * term=xterm-256color
 * colorterm=truecolor
 * scrollback=1000
 *
 * [Processes]
 * grace_period_ms=5000
 * interrupt_grace_period_ms=3000
 * @endcode
 */
struct DashboardConfig {
  int verbose = 0;
  string logDirectory = GetTempDirectory() + "archtui";
  string maxLogSize = "20971520";
  bool silent = false;

  string term = "xterm-256color";
  string colorTerm = "truecolor";
  int scrollbackLines = DEFAULT_SCROLLBACK_LINES;

  int gracePeriodMs = GUARD_GRACE_PERIOD_MS;
  int interruptGracePeriodMs = INTERRUPT_GRACE_PERIOD_MS;

  /**
   * @brief Loads `path`, keeping defaults for missing keys.
   * @throws std::runtime_error if the file cannot be read or a value is
   * malformed.
   */
  static DashboardConfig loadFromFile(const string& path);

  /** @brief Environment handed to every PTY child. */
  vector<pair<string, string>> terminalEnvironment() const {
    return {{"TERM", term}, {"COLORTERM", colorTerm}};
  }
};
}  // namespace archtui

#endif  // __ARCHTUI_DASHBOARD_CONFIG__

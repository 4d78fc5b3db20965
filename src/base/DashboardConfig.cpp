#include "DashboardConfig.hpp"

#include "SimpleIni.h"

namespace archtui {
namespace {
int parseInt(const CSimpleIniA& ini, const char* section, const char* key,
             int defaultValue, int minValue) {
  const char* value = ini.GetValue(section, key, NULL);
  if (!value) {
    return defaultValue;
  }
  int parsed;
  try {
    size_t consumed = 0;
    parsed = stoi(string(value), &consumed);
    if (consumed != strlen(value)) {
      throw std::invalid_argument(value);
    }
  } catch (const std::logic_error&) {
    throw std::runtime_error(string("Invalid value for [") + section + "] " +
                             key + ": " + value);
  }
  if (parsed < minValue) {
    throw std::runtime_error(string("Value for [") + section + "] " + key +
                             " must be at least " + to_string(minValue));
  }
  return parsed;
}
}  // namespace

DashboardConfig DashboardConfig::loadFromFile(const string& path) {
  CSimpleIniA ini(true, false, false);
  SI_Error rc = ini.LoadFile(path.c_str());
  if (rc < 0) {
    throw std::runtime_error("Invalid config file: " + path);
  }

  DashboardConfig config;
  config.verbose = parseInt(ini, "Logging", "verbose", config.verbose, 0);
  const char* logdir = ini.GetValue("Logging", "logdir", NULL);
  if (logdir && strlen(logdir)) {
    config.logDirectory = logdir;
  }
  int logsize = parseInt(ini, "Logging", "logsize", 0, 0);
  if (logsize != 0) {
    config.maxLogSize = to_string(logsize);
  }
  config.silent = parseInt(ini, "Logging", "silent", 0, 0) != 0;

  config.term = ini.GetValue("Terminal", "term", config.term.c_str());
  config.colorTerm =
      ini.GetValue("Terminal", "colorterm", config.colorTerm.c_str());
  config.scrollbackLines =
      parseInt(ini, "Terminal", "scrollback", config.scrollbackLines, 0);

  config.gracePeriodMs = parseInt(ini, "Processes", "grace_period_ms",
                                  config.gracePeriodMs, 0);
  config.interruptGracePeriodMs =
      parseInt(ini, "Processes", "interrupt_grace_period_ms",
               config.interruptGracePeriodMs, 0);
  VLOG(1) << "Loaded config from " << path;
  return config;
}
}  // namespace archtui

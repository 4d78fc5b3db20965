#include "LogHandler.hpp"
#include "TestHeaders.hpp"

using namespace archtui;

TEST_CASE("Log file names", "[LogHandler]") {
  LogSettings settings;
  settings.filenamePrefix = "archtui";
  settings.appendPid = false;

  string name = LogHandler::logFilename(settings, "");
  REQUIRE(name.rfind("archtui-", 0) == 0);
  REQUIRE(name.size() > 4);
  REQUIRE(name.substr(name.size() - 4) == ".log");
  REQUIRE(name.find('_' + to_string(getpid())) == string::npos);

  string stderrName = LogHandler::logFilename(settings, "stderr");
  REQUIRE(stderrName.rfind("archtui-stderr-", 0) == 0);

  settings.appendPid = true;
  string withPid = LogHandler::logFilename(settings, "");
  REQUIRE(withPid.find("_" + to_string(getpid()) + ".log") != string::npos);
}

TEST_CASE("Roll-out keeps one copy", "[LogHandler]") {
  string pattern = GetTempDirectory() + string("archtui_roll_XXXXXXXX");
  string directory = string(mkdtemp(&pattern[0]));
  string logFile = directory + "/full.log";
  {
    ofstream out(logFile);
    out << "first";
  }
  LogHandler::rolloutHandler(logFile.c_str(), 5);
  REQUIRE_FALSE(fs::exists(logFile));
  REQUIRE(fs::exists(logFile + ".1"));

  {
    ofstream out(logFile);
    out << "second";
  }
  LogHandler::rolloutHandler(logFile.c_str(), 6);
  ifstream rotated(logFile + ".1");
  string contents;
  rotated >> contents;
  REQUIRE(contents == "second");

  std::error_code ec;
  fs::remove_all(directory, ec);
}

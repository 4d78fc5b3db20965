#include <cxxopts.hpp>

#include "DashboardConfig.hpp"
#include "InterruptHook.hpp"
#include "LogHandler.hpp"
#include "ProcessGuard.hpp"
#include "PseudoTerminalConsole.hpp"
#include "ToolRunner.hpp"

using namespace archtui;

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  archtui::HandleTerminate();

  // Must come before any other thread or child exists
  shared_ptr<ProcessRegistry> registry = ProcessRegistry::global();
  try {
    InterruptHook::install(registry, std::chrono::milliseconds(
                                         INTERRUPT_GRACE_PERIOD_MS));
  } catch (const std::runtime_error& ex) {
    STFATAL << "Cannot install interrupt hook: " << ex.what();
  }

  cxxopts::Options options("archtui",
                           "Runs an interactive tool inside the dashboard");
  int exitCode = 1;
  try {
    options.positional_help("<command> [args...]");
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("logtostdout", "Write log to stdout")                //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("title", "Window title (defaults to the command)",
         cxxopts::value<std::string>()->default_value(""))  //
        ("headless", "Run without a terminal, echoing output")  //
        ("command", "Tool to run", cxxopts::value<std::string>())  //
        ("args", "Arguments for the tool",
         cxxopts::value<std::vector<std::string>>())  //
        ;
    options.parse_positional({"command", "args"});

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "archtui version " << ARCHTUI_VERSION << endl;
      exit(0);
    }
    if (!result.count("command")) {
      CLOG(INFO, "stdout") << "No command given\n" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    DashboardConfig config;
    if (result.count("cfgfile") && !result["cfgfile"].as<string>().empty()) {
      config = DashboardConfig::loadFromFile(result["cfgfile"].as<string>());
    }
    InterruptHook::setGracePeriod(
        std::chrono::milliseconds(config.interruptGracePeriodMs));

    bool headless =
        result.count("headless") > 0 || !::isatty(STDIN_FILENO);

    LogSettings logSettings;
    logSettings.directory = config.logDirectory;
    logSettings.logToStdout = result.count("logtostdout") > 0;
    // Anything written to stderr would land on top of the painted console
    logSettings.redirectStderr = !headless;
    logSettings.maxLogSize = config.maxLogSize;
    // Command line overrides the config file
    logSettings.verbose = result["verbose"].as<int>() > 0
                              ? result["verbose"].as<int>()
                              : config.verbose;
    logSettings.silent = config.silent;
    string logFile = LogHandler::configureLogging(&defaultConf, logSettings);
    el::Helpers::setThreadName("archtui-main");
    VLOG(1) << "Logging to " << logFile;
    if (headless && !result.count("headless")) {
      LOG(WARNING) << "stdin is not a terminal, running headless";
    }

    string command = result["command"].as<string>();
    vector<string> args;
    if (result.count("args")) {
      args = result["args"].as<vector<string>>();
    }
    string title = result["title"].as<string>();
    if (title.empty()) {
      title = command;
    }

    // Every child spawned below is terminated when this goes out of scope
    shared_ptr<ProcessGuard> guard(new ProcessGuard(
        registry, std::chrono::milliseconds(config.gracePeriodMs)));

    try {
      if (headless) {
        ToolRunner runner(nullptr, guard, config);
        exitCode = runner.runHeadless(command, args);
      } else {
        shared_ptr<Console> console(new PseudoTerminalConsole());
        InterruptHook::setBeforeExitCallback(
            [console]() { console->teardown(); });
        ToolRunner runner(console, guard, config);
        exitCode = runner.run(command, args, title);
        InterruptHook::setBeforeExitCallback(nullptr);
      }
    } catch (const std::runtime_error& ex) {
      LOG(ERROR) << "Error running " << command << ": " << ex.what();
      CLOG(INFO, "stdout") << "Error running " << command << ": "
                           << ex.what() << endl;
      exitCode = 1;
    }
    LOG(INFO) << command << " finished with exit code " << exitCode;
  } catch (cxxopts::OptionException& oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error& ex) {
    CLOG(INFO, "stdout") << "Error: " << ex.what() << endl;
    exit(1);
  }

  LogHandler::shutdown();
  return exitCode;
}

#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "SessionConfig.hpp"
#include "SessionError.hpp"
#include "SessionManager.hpp"
#include "SessionRequestHandler.hpp"

using namespace tsm;

namespace {
void printResult(const CommandResult &result) {
  if (result.success()) {
    if (!result.stdout_text().empty()) {
      CLOG(INFO, "stdout") << result.stdout_text() << endl;
    }
    if (result.truncated()) {
      CLOG(INFO, "stdout") << "[output truncated]" << endl;
    }
  } else {
    CLOG(INFO, "stdout") << sessionStatusName(result.status()) << ": "
                         << result.error() << endl;
  }
}

int runCommands(SessionManager *manager, const vector<string> &commands) {
  string sessionId = manager->createSession();
  int failures = 0;
  for (const auto &command : commands) {
    CommandResult result = manager->executeCommand(sessionId, command);
    printResult(result);
    if (!result.success()) {
      failures++;
      break;
    }
  }
  manager->closeSession(sessionId);
  return failures ? 1 : 0;
}

void runInteractive(SessionManager *manager) {
  string sessionId = manager->createSession();
  CLOG(INFO, "stdout") << "Session " << sessionId
                       << " ready.  Type commands, 'exit' or EOF to quit."
                       << endl;
  string line;
  while (true) {
    std::cout << "tsm> " << std::flush;
    if (!std::getline(std::cin, line)) {
      break;
    }
    if (trim(line) == "exit") {
      break;
    }
    if (trim(line).empty()) {
      continue;
    }
    CommandResult result = manager->executeCommand(sessionId, line);
    printResult(result);
    if (result.status() == SESSION_ENDED_ERROR) {
      break;
    }
  }
  manager->closeSession(sessionId);
}
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tsm::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, tsm::InterruptSignalHandler);
  // A vanished reader on a pty must not kill the host
  ::signal(SIGPIPE, SIG_IGN);

  cxxopts::Options options("tsmshell",
                           "Run shell commands through pty-backed sessions");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(
             GetTempDirectory() + "tsmshell"))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ("shell", "Shell to run in each session",
         cxxopts::value<std::string>())  //
        ("timeout", "Seconds to collect output for each command",
         cxxopts::value<double>())  //
        ("c,command", "Command to run, may be repeated",
         cxxopts::value<std::vector<std::string>>())  //
        ("json",
         "Serve JSON requests from stdin, one response per line on stdout")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tsmshell version " << TSM_VERSION << endl;
      exit(0);
    }

    // default max log file size is 20MB
    string maxlogsize = "20971520";
    SessionConfig config;

    string cfgfilename = result["cfgfile"].as<string>();
    if (!cfgfilename.empty()) {
      CSimpleIniA ini(true, false, false);
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc < 0) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
      try {
        applyIniToSessionConfig(ini, &config);
      } catch (const std::logic_error &le) {
        STFATAL << "Invalid value in config file " << cfgfilename << ": "
                << le.what();
      }

      // read verbose level (prioritize command line option over cfgfile)
      const char *vlevel = ini.GetValue("Debug", "verbose", NULL);
      if (!result.count("verbose") && vlevel) {
        el::Loggers::setVerboseLevel(atoi(vlevel));
      }
      // read silent setting
      const char *silent = ini.GetValue("Debug", "silent", NULL);
      if (silent && atoi(silent) != 0) {
        defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
      }
      // read log file size limit
      const char *logsize = ini.GetValue("Debug", "logsize", NULL);
      if (logsize && atoi(logsize) != 0) {
        // make sure maxlogsize is a string of int value
        maxlogsize = string(logsize);
      }
    }

    if (result.count("verbose")) {
      el::Loggers::setVerboseLevel(result["verbose"].as<int>());
    }
    if (result.count("shell")) {
      config.shell = result["shell"].as<string>();
    }
    if (result.count("timeout")) {
      try {
        config.commandTimeout =
            timeoutFromSeconds(result["timeout"].as<double>());
      } catch (const std::out_of_range& oor) {
        CLOG(INFO, "stdout") << "--timeout: " << oor.what() << endl;
        exit(1);
      }
    }

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    // The json protocol owns stdout, so logs go to file only there.
    bool logToStdout = result.count("logtostdout") && !result.count("json");
    LogHandler::setupLogFiles(&defaultConf, result["logdir"].as<string>(),
                              "tsmshell", logToStdout, true, maxlogsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("tsmshell-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    shared_ptr<SessionManager> manager(new SessionManager(config));
    int retval = 0;
    try {
      if (result.count("json")) {
        SessionRequestHandler handler(manager);
        handler.serve(std::cin, std::cout);
      } else if (result.count("command")) {
        retval =
            runCommands(manager.get(), result["command"].as<vector<string>>());
      } else {
        runInteractive(manager.get());
      }
    } catch (const SessionError &se) {
      CLOG(INFO, "stdout") << sessionStatusName(se.getStatus()) << ": "
                           << se.what() << endl;
      retval = 1;
    }
    manager->closeAllSessions();

    // Uninstall log rotation callback
    el::Helpers::uninstallPreRollOutCallback();
    return retval;
  } catch (cxxopts::OptionException &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    CLOG(INFO, "stdout") << "Error: " << re.what() << endl;
    exit(1);
  }
}

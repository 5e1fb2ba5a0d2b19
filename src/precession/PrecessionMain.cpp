#include <cxxopts.hpp>

#include "DefinitionLoader.hpp"
#include "DefinitionPath.hpp"
#include "Headers.hpp"
#include "LogHandler.hpp"
#include "PrecessionConfig.hpp"
#include "PrecessionException.hpp"
#include "SessionRenderer.hpp"
#include "SubprocessUtils.hpp"
#include "TmuxControl.hpp"

using namespace precession;

void handleParseException(std::exception& e, cxxopts::Options& options) {
  CLOG(INFO, "stdout") << "Exception: " << e.what() << "\n" << endl;
  CLOG(INFO, "stdout") << options.help({}) << endl;
  exit(1);
}

int listSessions() {
  const string directory = DefinitionPath::getDefinitionDirectory();
  auto names = DefinitionPath::listDefinitions(directory);
  if (names.empty()) {
    CLOG(INFO, "stdout") << "No session definitions in " << directory;
    return 0;
  }
  for (const auto& name : names) {
    CLOG(INFO, "stdout") << name;
  }
  return 0;
}

int startSession(const PrecessionConfig& config,
                 const cxxopts::ParseResult& result) {
  optional<string> sessionName;
  if (result.count("session")) {
    sessionName = result["session"].as<string>();
  }

  try {
    DefinitionPath definitionPath;
    if (result.count("file")) {
      definitionPath.setPathOverride(result["file"].as<string>());
    }
    SessionDefinition session = loadSessionDefinition(
        definitionPath.resolve(sessionName), config.defaultLayout);
    if (result.count("alias")) {
      applySessionAlias(&session, result["alias"].as<string>());
    }

    auto control = make_shared<TmuxControl>(
        make_shared<SubprocessUtils>(), config.tmuxBinary, config.socketName,
        TmuxControl::runningInsideTmux());
    RenderOptions renderOptions;
    renderOptions.attach = config.attach;
    SessionRenderer renderer(control, renderOptions);
    renderer.render(session);

    if (!config.attach) {
      CLOG(INFO, "stdout") << "Started session " << session.name
                           << ", attach with: tmux attach -t "
                           << session.name;
    }
  } catch (const PrecessionException& pe) {
    LOG(ERROR) << pe.what();
    CLOG(INFO, "stdout") << "Error: " << pe.what();
    return 1;
  }
  return 0;
}

int main(int argc, char** argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  precession::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, precession::InterruptSignalHandler);

  cxxopts::Options options("precession", "A simple tmux session starter");
  int exitCode = 0;
  try {
    options.positional_help("");
    options.custom_help(
        "[OPTION...] start [SESSION_NAME] [ALIAS] | list\n\n"
        "  Start, stop and manage pre-defined tmux sessions easily and "
        "declaratively.\n"
        "  start loads -f FILE, else <config home>/precession/"
        "SESSION_NAME.yaml,\n  else ./.session.yaml.  ALIAS starts the "
        "session under another name.\n  list prints the definitions in "
        "<config home>/precession.");

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("command", "start or list",
         cxxopts::value<std::string>())  //
        ("session", "Name of the session definition to start",
         cxxopts::value<std::string>())  //
        ("alias", "Start the session under this name instead",
         cxxopts::value<std::string>())  //
        ("f,file", "Definition file to load",
         cxxopts::value<std::string>())  //
        ("d,detach", "Do not attach to the session once it is started")  //
        ("c,cfgfile", "Location of the config file",
         cxxopts::value<std::string>())  //
        ("L,socket-name", "tmux server socket name",
         cxxopts::value<std::string>())  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>())  //
        ("l,logdir", "Base directory for log files.",
         cxxopts::value<std::string>())                 //
        ("logtostdout", "Write log to stdout")          //
        ("silent", "Disable logging");

    options.parse_positional({"command", "session", "alias"});
    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }

    if (result.count("version")) {
      CLOG(INFO, "stdout") << "precession version " << PRECESSION_VERSION
                           << endl;
      exit(0);
    }

    if (!result.count("command")) {
      CLOG(INFO, "stdout") << "Missing command, expected start or list"
                           << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(1);
    }

    PrecessionConfig config;
    const string cfgfile = result.count("cfgfile")
                               ? result["cfgfile"].as<string>()
                               : defaultConfigPath();
    bool loadedConfig = loadConfigFile(cfgfile, &config);
    if (!loadedConfig && result.count("cfgfile")) {
      CLOG(INFO, "stdout") << "Could not load config file " << cfgfile
                           << endl;
      exit(1);
    }

    // Command line options win over the config file
    if (result.count("socket-name")) {
      config.socketName = result["socket-name"].as<string>();
    }
    if (result.count("detach")) {
      config.attach = false;
    }
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("silent")) {
      config.silent = true;
    }
    if (result.count("logdir")) {
      config.logDirectory = result["logdir"].as<string>();
    }

    el::Loggers::setVerboseLevel(config.verbose);
    if (config.silent) {
      defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
    }

    LogHandler::setupLogFiles(&defaultConf, config.logDirectory, "precession",
                              result.count("logtostdout"));

    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("precession-main");

    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    if (loadedConfig) {
      LOG(INFO) << "Loaded config file " << cfgfile;
    }

    const string command = result["command"].as<string>();
    if (command == "start") {
      exitCode = startSession(config, result);
    } else if (command == "list") {
      exitCode = listSessions();
    } else {
      CLOG(INFO, "stdout") << "Unknown command '" << command
                           << "', expected start or list" << endl;
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exitCode = 1;
    }
  } catch (cxxopts::exceptions::exception& oe) {
    handleParseException(oe, options);
  } catch (ConfigParseException& cpe) {
    handleParseException(cpe, options);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();

  return exitCode;
}

#include <cxxopts.hpp>

#include "InspectConfig.hpp"
#include "InspectSession.hpp"
#include "LogHandler.hpp"

using namespace kjui;

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  kjui::HandleTerminate();

  // Override easylogging handler for sigint
  ::signal(SIGINT, kjui::InterruptSignalHandler);

  cxxopts::Options options(
      "kjui-inspect",
      "Decode captured Kakoune JSON UI traffic and encode UI requests");
  try {
    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("input", "Capture to decode, one JSON message per line (- for stdin)",
         cxxopts::value<std::string>()->default_value("-"))  //
        ("keys", "Print the keys message for a space separated key list",
         cxxopts::value<std::string>())  //
        ("resize", "Print the resize message for ROWSxCOLUMNS",
         cxxopts::value<std::string>())  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(""))  //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "kjui-inspect version " << KJUI_VERSION << endl;
      exit(0);
    }

    InspectConfig config;
    if (!result["cfgfile"].as<string>().empty()) {
      string cfgfilename = result["cfgfile"].as<string>();
      if (!loadInspectConfigFile(cfgfilename, &config)) {
        CLOG(ERROR, "stdout") << "Invalid config file: " << cfgfilename
                              << endl;
        exit(1);
      }
    }

    // Command line options win over the config file
    if (result.count("verbose")) {
      config.verbose = result["verbose"].as<int>();
    }
    if (result.count("logtostdout")) {
      config.logToStdout = true;
    }
    if (result.count("logdir")) {
      config.logDirectory = result["logdir"].as<string>();
    }

    el::Loggers::setVerboseLevel(config.verbose);
    if (!config.logDirectory.empty()) {
      LogHandler::setupLogFiles(&defaultConf, config.logDirectory,
                                "kjui-inspect", config.logToStdout,
                                config.maxLogSize);
      el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);
    } else {
      defaultConf.setGlobally(el::ConfigurationType::ToStandardOutput,
                              config.logToStdout ? "true" : "false");
    }
    if (config.silent) {
      LogHandler::silence(&defaultConf);
    }

    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);

    if (result.count("keys") || result.count("resize")) {
      if (result.count("keys")) {
        OutgoingRequest request =
            parseKeysArgument(result["keys"].as<string>());
        LOG(INFO) << "Encoding " << describeOutgoingRequest(request);
        CLOG(INFO, "stdout") << encodeOutgoingRequest(request) << endl;
      }
      if (result.count("resize")) {
        OutgoingRequest request =
            parseResizeArgument(result["resize"].as<string>());
        LOG(INFO) << "Encoding " << describeOutgoingRequest(request);
        CLOG(INFO, "stdout") << encodeOutgoingRequest(request) << endl;
      }
      return 0;
    }

    InspectSession session(std::cout);
    string input = result["input"].as<string>();
    bool ok;
    if (input == "-") {
      ok = session.run(std::cin);
    } else {
      std::ifstream captureFile(input);
      if (!captureFile.is_open()) {
        CLOG(ERROR, "stdout") << "Cannot open capture file: " << input << endl;
        exit(1);
      }
      ok = session.run(captureFile);
    }
    el::Helpers::uninstallPreRollOutCallback();
    return ok ? 0 : 1;
  } catch (const cxxopts::exceptions::exception &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &re) {
    CLOG(ERROR, "stdout") << re.what() << endl;
    exit(1);
  }
}

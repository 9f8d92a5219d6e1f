#include <cxxopts.hpp>

#include "LogHandler.hpp"
#include "OutputLedger.hpp"
#include "PipeSocketHandler.hpp"
#include "ProcessSupervisor.hpp"
#include "PtySessionProcess.hpp"
#include "RecoveryManager.hpp"
#include "SessionStore.hpp"
#include "SimpleIni.h"
#include "SupervisorHttpApi.hpp"
#include "SupervisorServer.hpp"
#include "TmuxMultiplexer.hpp"

using namespace tether;

namespace {
volatile sig_atomic_t stopRequested = 0;

void stopSignalHandler(int) { stopRequested = 1; }
}  // namespace

int main(int argc, char **argv) {
  // Setup easylogging configurations
  el::Configurations defaultConf = LogHandler::setupLogHandler(&argc, &argv);
  LogHandler::setupStdoutLogger();

  tether::HandleTerminate();

  cxxopts::Options options("tether-supervisor",
                           "Keeps interactive agent sessions alive and "
                           "streams them to viewers");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("endpoint", "Path of the viewer socket",
         cxxopts::value<std::string>()->default_value(""))  //
        ("port", "Port of the control API",
         cxxopts::value<int>()->default_value("0"))  //
        ("bindip", "IP of the control API",
         cxxopts::value<string>()->default_value(""))  //
        ("store", "Path of the session record file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("cfgfile", "Location of the config file",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logdir", "Directory for log files",
         cxxopts::value<std::string>()->default_value(""))  //
        ("logtostdout", "log to stdout")                    //
        ("v,verbose", "Enable verbose logging",
         cxxopts::value<int>()->default_value("0"), "LEVEL")  //
        ;

    auto result = options.parse(argc, argv);

    if (result.count("help")) {
      CLOG(INFO, "stdout") << options.help({}) << endl;
      exit(0);
    }
    if (result.count("version")) {
      CLOG(INFO, "stdout") << "tether-supervisor version " << TETHER_VERSION
                           << endl;
      exit(0);
    }

    string stateDir = sago::getDataHome() + "/tether";
    string endpointPath = stateDir + "/supervisor.sock";
    string storePath = stateDir + "/sessions.json";
    string logDir = GetTempDirectory() + "tether";
    string bindIp = "127.0.0.1";
    int port = 4810;
    string maxlogsize = "20971520";
    const char *vlevel = NULL;
    string vlevelStorage;

    SupervisorConfig config;
    if (!result["cfgfile"].as<string>().empty()) {
      string cfgfilename = result["cfgfile"].as<string>();
      CSimpleIniA ini(true, false, false);
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc < 0) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
      config.loadFromIni(cfgfilename);

      const char *value = ini.GetValue("Networking", "endpoint", NULL);
      if (value) {
        endpointPath = value;
      }
      value = ini.GetValue("Networking", "port", NULL);
      if (value) {
        port = stoi(value);
      }
      value = ini.GetValue("Networking", "bind_ip", NULL);
      if (value) {
        bindIp = value;
      }
      value = ini.GetValue("Store", "path", NULL);
      if (value) {
        storePath = value;
      }
      value = ini.GetValue("Debug", "logdir", NULL);
      if (value) {
        logDir = value;
      }
      value = ini.GetValue("Debug", "verbose", NULL);
      if (value) {
        vlevelStorage = value;
        vlevel = vlevelStorage.c_str();
      }
      // read silent setting
      const char *silent = ini.GetValue("Debug", "silent", NULL);
      if (silent && atoi(silent) != 0) {
        defaultConf.setGlobally(el::ConfigurationType::Enabled, "false");
      }
      // read log file size limit
      const char *logsize = ini.GetValue("Debug", "logsize", NULL);
      if (logsize && atoi(logsize) != 0) {
        maxlogsize = string(logsize);
      }
    }

    // Command line wins over the config file
    if (!result["endpoint"].as<string>().empty()) {
      endpointPath = result["endpoint"].as<string>();
    }
    if (result["port"].as<int>() > 0) {
      port = result["port"].as<int>();
    }
    if (!result["bindip"].as<string>().empty()) {
      bindIp = result["bindip"].as<string>();
    }
    if (!result["store"].as<string>().empty()) {
      storePath = result["store"].as<string>();
    }
    if (!result["logdir"].as<string>().empty()) {
      logDir = result["logdir"].as<string>();
    }
    LogHandler::applyVerbosity(result["verbose"].as<int>(), vlevel);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    LogHandler::setupLogFiles(&defaultConf, logDir, "tether-supervisor",
                              result.count("logtostdout") > 0, false, false,
                              maxlogsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("supervisor-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    fs::create_directories(stateDir);
    fs::create_directories(fs::path(endpointPath).parent_path());

    ::signal(SIGINT, stopSignalHandler);
    ::signal(SIGTERM, stopSignalHandler);
    ::signal(SIGPIPE, SIG_IGN);

    auto store = make_shared<JsonSessionStore>(storePath);
    auto ledger =
        make_shared<OutputLedger>(config.ledgerMaxEntries, config.ledgerTtlMs);
    auto multiplexer = make_shared<TmuxMultiplexer>(
        config, make_shared<SubprocessUtils>());
    auto supervisor = make_shared<ProcessSupervisor>(
        config, store, ledger, make_shared<PtyProcessFactory>(), multiplexer);
    auto recoveryManager = make_shared<RecoveryManager>(
        supervisor.get(), store, multiplexer, config);
    supervisor->setRecoveryManager(recoveryManager);

    LOG(INFO) << "Starting tether-supervisor " << TETHER_VERSION
              << ", store at " << storePath;
    recoveryManager->recoverAll();

    SupervisorHttpApi httpApi(supervisor, store);
    httpApi.start(bindIp, port);

    SocketEndpoint endpoint;
    endpoint.set_name(endpointPath);
    SupervisorServer server(make_shared<PipeSocketHandler>(), endpoint,
                            supervisor, config);
    thread serverThread([&server]() { server.run(); });

    while (!stopRequested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    LOG(INFO) << "Got a stop signal, shutting down";

    httpApi.stop();
    server.shutdown();
    serverThread.join();
    supervisor->shutdown();
    supervisor->setRecoveryManager(nullptr);
  } catch (cxxopts::exceptions::exception &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &ex) {
    STERROR << "tether-supervisor failed: " << ex.what();
    CLOG(INFO, "stdout") << "ERROR: " << ex.what() << endl;
    exit(1);
  } catch (const std::logic_error &ex) {
    // stoi/stoll on a malformed config value
    CLOG(INFO, "stdout") << "Invalid configuration value: " << ex.what()
                         << endl;
    exit(1);
  }

  // Uninstall log rotation callback
  el::Helpers::uninstallPreRollOutCallback();
  return 0;
}

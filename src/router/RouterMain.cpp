#include <cxxopts.hpp>

#include "AdminRouter.hpp"
#include "LogHandler.hpp"
#include "PipeSocketHandler.hpp"
#include "RouterServer.hpp"
#include "SessionStore.hpp"
#include "SimpleIni.h"
#include "SupervisorConfig.hpp"
#include "SupervisorLink.hpp"
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

  cxxopts::Options options("tether-router",
                           "Routes session viewers to the local supervisor "
                           "or to remote workers");
  try {
    options.allow_unrecognised_options();

    options.add_options()             //
        ("h,help", "Print help")      //
        ("version", "Print version")  //
        ("endpoint", "Path of the viewer socket",
         cxxopts::value<std::string>()->default_value(""))  //
        ("workerendpoint", "Path of the worker socket",
         cxxopts::value<std::string>()->default_value(""))  //
        ("supervisor", "Path of the supervisor's viewer socket",
         cxxopts::value<std::string>()->default_value(""))  //
        ("supervisorport", "Port of the supervisor's control API",
         cxxopts::value<int>()->default_value("0"))  //
        ("port", "Port of the router API",
         cxxopts::value<int>()->default_value("0"))  //
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
      CLOG(INFO, "stdout") << "tether-router version " << TETHER_VERSION
                           << endl;
      exit(0);
    }

    string stateDir = sago::getDataHome() + "/tether";
    string viewerPath = stateDir + "/router.sock";
    string workerPath = stateDir + "/workers.sock";
    string supervisorPath = stateDir + "/supervisor.sock";
    string storePath = stateDir + "/sessions.json";
    string logDir = GetTempDirectory() + "tether";
    string supervisorHost = "127.0.0.1";
    int supervisorPort = 4810;
    string bindIp = "127.0.0.1";
    int port = 4811;
    string maxlogsize = "20971520";
    const char *vlevel = NULL;
    string vlevelStorage;
    RouterOptions routerOptions;

    SupervisorConfig config;
    if (!result["cfgfile"].as<string>().empty()) {
      string cfgfilename = result["cfgfile"].as<string>();
      CSimpleIniA ini(true, false, false);
      SI_Error rc = ini.LoadFile(cfgfilename.c_str());
      if (rc < 0) {
        STFATAL << "Invalid config file: " << cfgfilename;
      }
      // The router shares the tmux settings for its liveness check
      config.loadFromIni(cfgfilename);
      routerOptions.viewerBufferBytes = config.viewerBufferBytes;

      const char *value = ini.GetValue("Router", "endpoint", NULL);
      if (value) {
        viewerPath = value;
      }
      value = ini.GetValue("Router", "worker_endpoint", NULL);
      if (value) {
        workerPath = value;
      }
      value = ini.GetValue("Router", "port", NULL);
      if (value) {
        port = stoi(value);
      }
      value = ini.GetValue("Router", "bind_ip", NULL);
      if (value) {
        bindIp = value;
      }
      value = ini.GetValue("Router", "cleanup_interval_ms", NULL);
      if (value) {
        routerOptions.cleanupIntervalMs = stoll(value);
      }
      value = ini.GetValue("Router", "worker_max_silence_ms", NULL);
      if (value) {
        routerOptions.workerMaxSilenceMs = stoll(value);
      }
      value = ini.GetValue("Networking", "endpoint", NULL);
      if (value) {
        supervisorPath = value;
      }
      value = ini.GetValue("Networking", "port", NULL);
      if (value) {
        supervisorPort = stoi(value);
      }
      value = ini.GetValue("Networking", "bind_ip", NULL);
      if (value) {
        supervisorHost = value;
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
      viewerPath = result["endpoint"].as<string>();
    }
    if (!result["workerendpoint"].as<string>().empty()) {
      workerPath = result["workerendpoint"].as<string>();
    }
    if (!result["supervisor"].as<string>().empty()) {
      supervisorPath = result["supervisor"].as<string>();
    }
    if (result["supervisorport"].as<int>() > 0) {
      supervisorPort = result["supervisorport"].as<int>();
    }
    if (result["port"].as<int>() > 0) {
      port = result["port"].as<int>();
    }
    if (!result["store"].as<string>().empty()) {
      storePath = result["store"].as<string>();
    }
    if (!result["logdir"].as<string>().empty()) {
      logDir = result["logdir"].as<string>();
    }
    LogHandler::applyVerbosity(result["verbose"].as<int>(), vlevel);

    GOOGLE_PROTOBUF_VERIFY_VERSION;

    LogHandler::setupLogFiles(&defaultConf, logDir, "tether-router",
                              result.count("logtostdout") > 0, false, false,
                              maxlogsize);
    // Reconfigure default logger to apply settings above
    el::Loggers::reconfigureLogger("default", defaultConf);
    // set thread name
    el::Helpers::setThreadName("router-main");
    // Install log rotation callback
    el::Helpers::installPreRollOutCallback(LogHandler::rolloutHandler);

    fs::create_directories(stateDir);

    ::signal(SIGINT, stopSignalHandler);
    ::signal(SIGTERM, stopSignalHandler);
    ::signal(SIGPIPE, SIG_IGN);

    auto socketHandler = make_shared<PipeSocketHandler>();
    auto store = make_shared<JsonSessionStore>(storePath);
    auto workers = make_shared<WorkerRegistry>();
    auto supervisorLink = make_shared<HttpSupervisorLink>(
        supervisorHost, supervisorPort, config.subprocessTimeoutMs);
    auto multiplexer = make_shared<TmuxMultiplexer>(
        config, make_shared<SubprocessUtils>());
    SocketEndpoint supervisorEndpoint;
    supervisorEndpoint.set_name(supervisorPath);
    auto router = make_shared<AdminRouter>(store, workers, supervisorLink,
                                           socketHandler, supervisorEndpoint,
                                           multiplexer);

    SocketEndpoint viewerEndpoint;
    viewerEndpoint.set_name(viewerPath);
    SocketEndpoint workerEndpoint;
    workerEndpoint.set_name(workerPath);
    RouterServer server(socketHandler, viewerEndpoint, workerEndpoint, router,
                        workers, routerOptions);
    server.startHttpApi(bindIp, port);
    LOG(INFO) << "Starting tether-router " << TETHER_VERSION;
    thread serverThread([&server]() { server.run(); });

    while (!stopRequested) {
      std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    LOG(INFO) << "Got a stop signal, shutting down";
    server.stopHttpApi();
    server.shutdown();
    serverThread.join();
  } catch (cxxopts::exceptions::exception &oe) {
    CLOG(INFO, "stdout") << "Exception: " << oe.what() << "\n" << endl;
    CLOG(INFO, "stdout") << options.help({}) << endl;
    exit(1);
  } catch (const std::runtime_error &ex) {
    STERROR << "tether-router failed: " << ex.what();
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

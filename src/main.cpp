#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>
#include <csignal>
#include <filesystem>
#include <functional>
#include <thread>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "platform.hpp"
#include "settings_manager.hpp"
#include "sync_config.hpp"
#include "sync_engine.hpp"

using namespace dotsync;

namespace {

// Signals only request a stop; the pass in progress always finishes. Later
// signals are absorbed so a second Ctrl+C cannot kill the process mid-write.
class SignalWatcher {
public:
  SignalWatcher(SyncEngine& engine, Logger& logger)
    : engine_(engine), logger_(logger), signals_(io_, SIGINT, SIGTERM) {
    signals_.add(SIGHUP);
    arm();
    thread_ = std::thread([this](){ io_.run(); });
  }

  ~SignalWatcher() {
    io_.stop();
    if(thread_.joinable()) thread_.join();
  }

private:
  void arm() {
    signals_.async_wait([this](const std::error_code& ec, int signo) {
      if(ec) return;
      logger_.info("Received termination signal signal={}", signo);
      engine_.stop();
      arm();
    });
  }

  SyncEngine& engine_;
  Logger& logger_;
  asio::io_context io_;
  asio::signal_set signals_;
  std::thread thread_;
};

} // namespace

int main(int argc, char** argv){
  try {
    std::string process_name = (argc > 0 && argv && argv[0])
      ? std::filesystem::path(argv[0]).filename().string()
      : "dotsync";
    CommandLineParser parser(process_name);
    SettingsManager settings;

    std::vector<std::string> args;
    if(argc > 1) args.assign(argv + 1, argv + argc);

    std::string error;
    if(!parser.parse_layered(args, settings, SettingsManager::process_environment, error)) {
      init_logging();
      print_err("{}", error);
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init_logging(settings.get<std::string>("log_level"), settings.get<std::string>("log_format"));
    Logger logger("dotsync");

    SyncConfig config;
    try {
      config = SyncConfig::resolve(settings);
    } catch(const ConfigError& e) {
      logger.error("Invalid configuration: {}", e.what());
      return 1;
    }
    logger.debug("Resolved configuration src={} dst={} watch={} umask={:03o}",
                 config.source_root.string(), config.dest_root.string(), config.watch,
                 static_cast<unsigned>(config.umask));

    PosixPlatform platform;
    SyncEnvironment env{config, platform, platform, platform, logger};
    SyncEngine engine(env);
    SignalWatcher signals(engine, logger);

    return engine.run();
  } catch(const std::exception& e) {
    init_logging();
    Logger logger("dotsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}

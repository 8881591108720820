#include <asio.hpp>
#include <cpptrace/cpptrace.hpp>

#include <csignal>
#include <filesystem>
#include <thread>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "settings_manager.hpp"
#include "sync_node.hpp"

int main(int argc, char** argv){
  try {
    SyncNode::Options options;
    options.workspace_root = std::filesystem::current_path();

    auto settings = std::make_shared<SettingsManager>();
    settings->set_settings_path(options.workspace_root / ".config" / "settings.json");
    settings->load();

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? std::filesystem::path(argv[0]).filename().string() : "lansync");
    if(!parser.parse(argc, argv, *settings)) {
      return 1;
    }
    if(settings->help_requested()) {
      parser.usage(*settings);
      return 0;
    }

    SyncNode node(settings, options);
    auto logger = node.logger();
    if(settings->save_requested()) {
      if(settings->save()) {
        logger->info("Settings saved to {}", settings->settings_path().string());
      } else {
        logger->error("Unable to persist settings to {}", settings->settings_path().string());
      }
    }

    node.start();

    asio::io_context signal_io;
    asio::signal_set signals(signal_io, SIGINT, SIGTERM);
    signals.async_wait([&node, logger](const std::error_code& ec, int signal_number){
      if(ec) return;
      logger->info("Signal {} received, shutting down", signal_number);
      node.request_stop();
    });
    std::thread signal_thread([&signal_io](){ signal_io.run(); });

    node.run();
    node.stop();

    signal_io.stop();
    signal_thread.join();
    return 0;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("lansync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}

#include <cpptrace/cpptrace.hpp>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>

#include "command_line_parser.hpp"
#include "log.hpp"
#include "run_history.hpp"
#include "server_config.hpp"
#include "settings_manager.hpp"
#include "sync_plan.hpp"
#include "sync_tool.hpp"

int main(int argc, char** argv){
  try {
    SettingsManager settings;
    settings.load_from_file(lsync_dir() / "settings.json");

    CommandLineParser parser((argc > 0 && argv && argv[0]) ? argv[0] : "lsync");
    try {
      parser.parse(argc, argv, settings);
    } catch(const std::invalid_argument& e) {
      print_err("{}", e.what());
      parser.usage();
      return 1;
    }
    if(settings.help_requested()) {
      parser.usage();
      return 0;
    }

    init(settings.get<bool>("verbose"));
    auto logger = std::make_shared<Logger>("lsync");
    logger->debug("Verbose logging enabled");

    auto server = settings.get<std::string>("server");
    if(server.empty()) {
      print_err("--server is required");
      parser.usage();
      return 1;
    }

    std::filesystem::path config_path = settings.get<std::string>("config");
    if(config_path.empty()) config_path = default_config_path();
    auto config = load_config(config_path);
    auto profile = find_server(config, server);

    SyncTool::Options options;
    options.sync.file_or_path = settings.get<std::string>("file_or_path");
    options.sync.master = settings.get<std::string>("master");
    options.sync.delete_extraneous = settings.get<bool>("delete");
    options.sync.back = settings.get<bool>("back");
    options.sync.git_repo = settings.get<bool>("git");
    options.assume_yes = settings.get<bool>("yes");
    options.drain_on_exit = settings.get<bool>("drain_on_exit");

    int idle_us = settings.get<int>("poll_idle_us");
    if(idle_us < 0) {
      logger->error("Invalid poll_idle_us '{}'", idle_us);
      return 1;
    }
    options.idle_sleep = std::chrono::microseconds(idle_us);

    std::optional<std::filesystem::path> rsync_ignore;
    std::error_code ec;
    if(std::filesystem::exists(rsync_ignore_path(), ec)) {
      rsync_ignore = rsync_ignore_path();
    }

    auto plan = make_sync_plan(profile, options.sync, std::filesystem::current_path(),
                               config.sync_dirs, rsync_ignore);
    logger->debug("{} transfer(s) planned for {}", plan.commands.size(), plan.local_dir.string());

    SyncTool tool(std::move(profile), std::move(plan), std::move(options),
                  RunHistory(RunHistory::default_path()), std::cout, std::cin, logger);
    return tool.run();
  } catch(const ConfigError& e) {
    init(false);
    Logger logger("lsync-main");
    logger.error("{}", e.what());
    return 1;
  } catch(const std::exception& e) {
    init(false);
    Logger logger("lsync-main");
    logger.error("Exception: {}", e.what());
    cpptrace::generate_trace().print();
    return 1;
  }
}

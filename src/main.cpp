#include "cli.hpp"          // for parse_cli, run_cli
#include "config.hpp"       // for load_app_config
#include "definitions.hpp"  // for error_inter
#include "utils.hpp"        // for safe_getenv

// import approf
#include "approf/logger.hpp"

#include <chrono>       // for seconds
#include <filesystem>   // for create_directories
#include <string_view>  // for string_view
#include <vector>       // for vector

#include <spdlog/async.h>                  // for create_async
#include <spdlog/common.h>                 // for level
#include <spdlog/sinks/basic_file_sink.h>  // for basic_file_sink_mt
#include <spdlog/spdlog.h>                 // for set_default_logger, set_level

namespace fs = std::filesystem;

int main(int argc, char** argv) {
    const std::vector<std::string_view> args(argv + 1, argv + argc);
    const auto& command = profilectl::parse_cli(args);
    if (!command) {
        profilectl::print_usage();
        return 1;
    }

    const auto& env_config_path = utils::safe_getenv("PROFILECTL_CONFIG");
    const auto& config_path     = env_config_path.empty() ? profilectl::DEFAULT_CONFIG_PATH : env_config_path;
    const auto& config          = profilectl::load_app_config(config_path);
    if (!config) {
        error_inter("Failed to load config '{}': {}\n", config_path, config.error());
        return 1;
    }

    // Initialize logger.
    std::error_code err{};
    fs::create_directories(fs::path{config->app_log}.parent_path(), err);
    try {
        auto logger = spdlog::create_async<spdlog::sinks::basic_file_sink_mt>("profilectl_logger", config->app_log);
        spdlog::set_default_logger(logger);
        spdlog::set_pattern("[%r][%^---%L---%$] %v");
        spdlog::set_level(spdlog::level::from_str(config->log_level));
        spdlog::flush_every(std::chrono::seconds(5));

        // Set approf logger.
        approf::logger::set_logger(logger);
    } catch (const spdlog::spdlog_ex& ex) {
        error_inter("Failed to open log '{}': {}\n", config->app_log, ex.what());
        return 1;
    }

    const auto exit_code = profilectl::run_cli(*command, *config);

    spdlog::shutdown();
    return exit_code;
}

#include "approf/logger.hpp"

#include <utility>  // for move

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>

namespace approf::logger {

void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept {
    spdlog::set_default_logger(std::move(default_logger));
}

auto make_file_logger(std::string_view logger_name, std::string_view filepath, bool truncate) noexcept
    -> std::expected<std::shared_ptr<spdlog::logger>, std::string> {
    try {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(std::string{filepath}, truncate);
        return std::make_shared<spdlog::logger>(std::string{logger_name}, std::move(file_sink));
    } catch (const spdlog::spdlog_ex& ex) {
        return std::unexpected(std::string{ex.what()});
    }
}

}  // namespace approf::logger

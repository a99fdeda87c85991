#include "approf/profile_logger.hpp"
#include "approf/logger.hpp"

#include <filesystem>    // for create_directories
#include <system_error>  // for error_code
#include <utility>       // for move

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace approf {

FileProfileLogger::FileProfileLogger(std::shared_ptr<spdlog::logger> logger) noexcept
  : m_logger(std::move(logger)) {
    m_logger->set_pattern("%Y-%m-%d %H:%M:%S.%e %v");
    m_logger->set_level(spdlog::level::trace);
    m_logger->flush_on(spdlog::level::err);
}

FileProfileLogger::~FileProfileLogger() {
    close();
}

auto FileProfileLogger::log_path(std::string_view log_dir, std::string_view profile_id) noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{}/{}.log"), log_dir, profile_id);
}

auto FileProfileLogger::open(std::string_view log_dir, std::string_view profile_id) noexcept
    -> std::expected<std::unique_ptr<FileProfileLogger>, std::string> {
    std::error_code err{};
    fs::create_directories(log_dir, err);
    if (err) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to create log directory '{}': {}"), log_dir, err.message()));
    }

    const auto& filepath = log_path(log_dir, profile_id);
    auto logger          = logger::make_file_logger(fmt::format(FMT_COMPILE("profile-{}"), profile_id), filepath);
    if (!logger) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to open profile log '{}': {}"), filepath, logger.error()));
    }
    return std::make_unique<FileProfileLogger>(std::move(*logger));
}

void FileProfileLogger::println(std::string_view message) noexcept {
    /* clang-format off */
    if (!m_logger) { return; }
    /* clang-format on */
    m_logger->info(message);
}

void FileProfileLogger::println(std::string_view message, std::string_view cause) noexcept {
    /* clang-format off */
    if (!m_logger) { return; }
    /* clang-format on */
    if (message.empty()) {
        m_logger->error(cause);
        return;
    }
    m_logger->error("{}\n  caused by: {}", message, cause);
}

void FileProfileLogger::close() noexcept {
    /* clang-format off */
    if (!m_logger) { return; }
    /* clang-format on */
    m_logger->flush();
    m_logger.reset();
}

}  // namespace approf

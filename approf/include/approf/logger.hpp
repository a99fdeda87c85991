#ifndef APPROF_LOGGER_HPP
#define APPROF_LOGGER_HPP

#include <expected>     // for expected
#include <memory>       // for shared_ptr
#include <string>       // for string
#include <string_view>  // for string_view

#include <spdlog/spdlog.h>

namespace approf::logger {

// Set library default logger
void set_logger(std::shared_ptr<spdlog::logger> default_logger) noexcept;

/// @brief Creates a synchronous logger writing into a file.
/// @param logger_name The name of the logger, must be unique in the spdlog registry.
/// @param filepath The path of the log file, parent directories are created.
/// @param truncate Whether to truncate the file instead of appending.
/// @return The logger, or the reason the sink could not be opened.
auto make_file_logger(std::string_view logger_name, std::string_view filepath, bool truncate = false) noexcept
    -> std::expected<std::shared_ptr<spdlog::logger>, std::string>;

}  // namespace approf::logger

#endif  // APPROF_LOGGER_HPP

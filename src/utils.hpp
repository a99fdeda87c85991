#ifndef UTILS_HPP
#define UTILS_HPP

#include <string>       // for string
#include <string_view>  // for string_view

namespace utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view;

/// @brief Whether commands are only logged instead of being run (DIRTY_CMD_RUN=1).
[[nodiscard]] auto is_dirty_cmd_run() noexcept -> bool;

/// @brief Runs a shell command, capturing its combined output.
/// @param command The command line passed to the shell.
/// @param output Receives the command output without the trailing newline.
/// @return true when the command exited with status 0.
auto exec_checked(std::string_view command, std::string* output = nullptr) noexcept -> bool;

}  // namespace utils

#endif  // UTILS_HPP

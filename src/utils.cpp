#include "utils.hpp"

#include <sys/wait.h>  // for WEXITSTATUS, WIFEXITED

#include <cstdio>   // for feof, fgets, pclose, popen
#include <cstdlib>  // for getenv

#include <array>   // for array
#include <memory>  // for unique_ptr

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace utils {

auto safe_getenv(const char* env_name) noexcept -> std::string_view {
    const char* const raw_val = getenv(env_name);
    return raw_val != nullptr ? std::string_view{raw_val} : std::string_view{};
}

auto is_dirty_cmd_run() noexcept -> bool {
    return utils::safe_getenv("DIRTY_CMD_RUN") == "1"sv;
}

auto exec_checked(std::string_view command, std::string* output) noexcept -> bool {
    const bool log_exec_cmds = utils::safe_getenv("LOG_EXEC_CMDS") == "1"sv;
    if (log_exec_cmds && spdlog::default_logger_raw() != nullptr) {
        spdlog::debug("[exec] cmd := '{}'", command);
    }

    const auto& cmd_formatted = fmt::format(FMT_COMPILE("{} 2>&1"), command);
    auto* pipe                = popen(cmd_formatted.c_str(), "r");
    if (pipe == nullptr) {
        spdlog::error("popen failed! '{}'", command);
        return false;
    }

    std::string result{};
    std::array<char, 128> buffer{};
    while (!feof(pipe)) {
        if (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) != nullptr) {
            result += buffer.data();
        }
    }
    const auto status = pclose(pipe);

    if (result.ends_with('\n')) {
        result.pop_back();
    }
    const bool success = (status != -1) && WIFEXITED(status) && (WEXITSTATUS(status) == 0);
    if (!success) {
        spdlog::error("[exec] '{}' failed with status {}: {}", command, status, result);
    }
    if (output != nullptr) {
        *output = std::move(result);
    }
    return success;
}

}  // namespace utils

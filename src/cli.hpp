#ifndef CLI_HPP
#define CLI_HPP

#include "config.hpp"

#include <cstdint>      // for int32_t
#include <optional>     // for optional
#include <span>         // for span
#include <string>       // for string
#include <string_view>  // for string_view

namespace profilectl {

enum class CliAction : std::uint8_t {
    Apply,
    List,
    Delete,
    Id,
};

/// Parsed command line.
struct CliCommand final {
    CliAction action{CliAction::List};
    // profile id for apply/delete, profile name for id
    std::string argument{};
    std::optional<std::string> state{};
};

/// @brief Parses the arguments after the program name.
/// @return The command, std::nullopt on usage errors.
[[nodiscard]] auto parse_cli(std::span<const std::string_view> args) noexcept -> std::optional<CliCommand>;

void print_usage() noexcept;

/// @brief Runs a command against the configured profile store.
/// @return The process exit code.
auto run_cli(const CliCommand& command, const AppConfig& config) noexcept -> std::int32_t;

}  // namespace profilectl

#endif  // CLI_HPP

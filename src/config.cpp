#include "config.hpp"

// import approf
#include "approf/file_utils.hpp"

#include <filesystem>    // for exists
#include <system_error>  // for error_code

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

#define TOML_EXCEPTIONS 0  // disable exceptions
#include <toml++/toml.h>

namespace fs = std::filesystem;

using namespace std::string_view_literals;

namespace profilectl {

auto get_default_config() noexcept -> AppConfig {
    using approf::OpCode;

    AppConfig config{};
    config.commands = CommandTemplates{
        {OpCode::BlockComponents, "pm disable --user {user} {package}/{component}"},
        {OpCode::UnblockComponents, "pm enable --user {user} {package}/{component}"},
        {OpCode::SetAppOps, "appops set --user {user} {package} {op} {mode}"},
        {OpCode::RevokePermissions, "pm revoke --user {user} {package} {permission}"},
        {OpCode::GrantPermissions, "pm grant --user {user} {package} {permission}"},
        {OpCode::Freeze, "pm disable-user --user {user} {package}"},
        {OpCode::Unfreeze, "pm enable --user {user} {package}"},
        {OpCode::ForceStop, "am force-stop --user {user} {package}"},
        {OpCode::ClearCache, "rm -rf /data/user/{user}/{package}/cache /data/user/{user}/{package}/code_cache"},
        {OpCode::ClearData, "pm clear --user {user} {package}"},
    };
    return config;
}

auto parse_app_config(std::string_view toml_content) noexcept
    -> std::expected<AppConfig, std::string> {
    auto config = get_default_config();

    toml::parse_result parsed = toml::parse(toml_content);
    if (parsed.failed()) {
        return std::unexpected(fmt::format(FMT_COMPILE("TOML parse error: {}"), parsed.error().description()));
    }
    const auto& config_table = std::move(parsed).table();

    // [paths]
    if (auto profiles_dir = config_table["paths"]["profiles_dir"].value<std::string>()) {
        config.profiles_dir = std::move(*profiles_dir);
    }
    if (auto log_dir = config_table["paths"]["log_dir"].value<std::string>()) {
        config.log_dir = std::move(*log_dir);
    }
    if (auto app_log = config_table["paths"]["app_log"].value<std::string>()) {
        config.app_log = std::move(*app_log);
    }

    // [general]
    if (auto log_level = config_table["general"]["log_level"].value<std::string>()) {
        config.log_level = std::move(*log_level);
    }
    if (auto dry_run = config_table["general"]["dry_run"].value<bool>()) {
        config.dry_run = *dry_run;
    }
    if (auto users_dir = config_table["general"]["users_dir"].value<std::string>()) {
        config.users_dir = std::move(*users_dir);
    }
    if (const auto* users_arr = config_table["general"]["users"].as_array()) {
        std::vector<std::int32_t> users{};
        for (const auto& user_node : *users_arr) {
            auto user = user_node.value<std::int32_t>();
            if (!user) {
                return std::unexpected("'general.users' must only contain integers");
            }
            users.push_back(*user);
        }
        config.users = std::move(users);
    }

    // [commands]
    if (const auto* commands_table = config_table["commands"].as_table()) {
        for (auto&& [key, value] : *commands_table) {
            const auto op_name = std::string_view{key.str()};
            auto op            = approf::op_code_from_string(op_name);
            if (!op || *op == approf::OpCode::None) {
                return std::unexpected(fmt::format(FMT_COMPILE("Unknown operation '{}' in [commands]"), op_name));
            }
            auto command = value.value<std::string>();
            if (!command) {
                return std::unexpected(fmt::format(FMT_COMPILE("Command of '{}' must be a string"), op_name));
            }
            // empty command removes the default
            if (command->empty()) {
                config.commands.erase(*op);
            } else {
                config.commands[*op] = std::move(*command);
            }
        }
    }

    return config;
}

auto load_app_config(std::string_view filepath) noexcept
    -> std::expected<AppConfig, std::string> {
    std::error_code err{};
    if (!fs::exists(filepath, err)) {
        spdlog::debug("Config '{}' not found, using defaults", filepath);
        return get_default_config();
    }

    const auto& content = approf::file_utils::read_whole_file(filepath);
    if (!content) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to read config '{}'"), filepath));
    }
    return parse_app_config(*content);
}

}  // namespace profilectl

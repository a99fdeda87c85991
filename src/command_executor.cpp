#include "command_executor.hpp"
#include "utils.hpp"

#include <algorithm>  // for contains
#include <variant>    // for get_if

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

struct CommandArgs final {
    std::string_view package_name{};
    std::int32_t user{};
    std::string_view component{};
    std::string_view permission{};
    std::int32_t app_op{};
    std::string_view mode{};
    std::uint32_t flags{};
    std::string_view backup_name{};
};

auto format_command(std::string_view command_template, const CommandArgs& args) -> std::string {
    return fmt::format(fmt::runtime(command_template),
        fmt::arg("package", args.package_name),
        fmt::arg("user", args.user),
        fmt::arg("component", args.component),
        fmt::arg("permission", args.permission),
        fmt::arg("op", args.app_op),
        fmt::arg("mode", args.mode),
        fmt::arg("flags", args.flags),
        fmt::arg("name", args.backup_name));
}

// Expands one target pair into one argument set per sub-item of the options.
auto expand_args(std::string_view package_name, std::int32_t user, const approf::OperationOptions& options) -> std::vector<CommandArgs> {
    const CommandArgs base_args{.package_name = package_name, .user = user};
    std::vector<CommandArgs> args_list{};

    if (const auto* component_opts = std::get_if<approf::ComponentOptions>(&options)) {
        for (const auto& component : component_opts->components) {
            auto args      = base_args;
            args.component = component;
            args_list.push_back(args);
        }
    } else if (const auto* app_ops_opts = std::get_if<approf::AppOpsOptions>(&options)) {
        for (const auto app_op : app_ops_opts->app_ops) {
            auto args   = base_args;
            args.app_op = app_op;
            args.mode   = profilectl::app_op_mode_to_string(app_ops_opts->mode);
            args_list.push_back(args);
        }
    } else if (const auto* permission_opts = std::get_if<approf::PermissionOptions>(&options)) {
        for (const auto& permission : permission_opts->permissions) {
            auto args       = base_args;
            args.permission = permission;
            args_list.push_back(args);
        }
    } else if (const auto* backup_opts = std::get_if<approf::BackupOptions>(&options)) {
        auto args  = base_args;
        args.flags = backup_opts->flags;
        if (backup_opts->backup_names.empty()) {
            args_list.push_back(args);
        }
        for (const auto& backup_name : backup_opts->backup_names) {
            args.backup_name = backup_name;
            args_list.push_back(args);
        }
    } else {
        args_list.push_back(base_args);
    }
    return args_list;
}

}  // namespace

namespace profilectl {

auto app_op_mode_to_string(approf::AppOpMode mode) noexcept -> std::string_view {
    using approf::AppOpMode;

    switch (mode) {
    case AppOpMode::Allowed:
        return "allow"sv;
    case AppOpMode::Ignored:
        return "ignore"sv;
    case AppOpMode::Errored:
        return "deny"sv;
    case AppOpMode::Default:
        return "default"sv;
    case AppOpMode::Foreground:
        return "foreground"sv;
    }
    return "default"sv;
}

auto CommandBatchExecutor::plan(approf::OpCode op, const approf::Targets& targets, const approf::OperationOptions& options) const
    -> std::expected<std::vector<PlannedCommand>, std::string> {
    const auto& command_template = m_commands.find(op);
    if (command_template == m_commands.end()) {
        return std::unexpected(fmt::format("No command configured for {}", op));
    }

    std::vector<PlannedCommand> commands{};
    try {
        for (std::size_t i = 0; i < targets.size(); ++i) {
            for (const auto& args : expand_args(targets.packages[i], targets.users[i], options)) {
                commands.emplace_back(PlannedCommand{
                    .package_name = targets.packages[i],
                    .user         = targets.users[i],
                    .command      = format_command(command_template->second, args),
                });
            }
        }
    } catch (const fmt::format_error& ex) {
        return std::unexpected(fmt::format("Invalid command template for {}: {}", op, ex.what()));
    }
    return commands;
}

auto CommandBatchExecutor::execute(approf::OpCode op, const approf::Targets& targets, const approf::OperationOptions& options) -> approf::ExecutionResult {
    approf::ExecutionResult result{};

    auto commands = plan(op, targets, options);
    if (!commands) {
        spdlog::error("{}", commands.error());
        result.success = false;
        for (std::size_t i = 0; i < targets.size(); ++i) {
            result.failed.emplace_back(approf::FailedTarget{.package_name = targets.packages[i], .user = targets.users[i]});
        }
        return result;
    }

    const bool dry_run = m_dry_run || utils::is_dirty_cmd_run();
    for (const auto& planned : *commands) {
        ++m_executed_count;
        if (dry_run) {
            spdlog::info("[dry-run] {}", planned.command);
            continue;
        }
        if (utils::exec_checked(planned.command)) {
            continue;
        }

        const approf::FailedTarget failed_target{.package_name = planned.package_name, .user = planned.user};
        if (!std::ranges::contains(result.failed, failed_target)) {
            result.failed.push_back(failed_target);
        }
    }
    result.success = result.failed.empty();
    return result;
}

void CommandBatchExecutor::release() noexcept {
    spdlog::debug("Issued {} commands", m_executed_count);
}

}  // namespace profilectl

#include "cli.hpp"
#include "command_executor.hpp"
#include "definitions.hpp"
#include "user_registry.hpp"

// import approf
#include "approf/profile_runner.hpp"
#include "approf/profile_store.hpp"

#include <fmt/compile.h>
#include <fmt/format.h>

#include <spdlog/spdlog.h>

using namespace std::string_view_literals;

namespace {

class ConsoleProgress final : public approf::ProgressSink {
 public:
    void set_total(std::int32_t total, std::int32_t current) noexcept override {
        output_inter("Applying profile: {}/{} units of work\n", current, total);
    }
};

auto run_apply(const profilectl::CliCommand& command, const profilectl::AppConfig& config) noexcept -> std::int32_t {
    const approf::ProfileStore store{config.profiles_dir};
    const profilectl::SystemUserRegistry user_registry{config.users, config.users_dir};
    profilectl::CommandBatchExecutor executor{config.commands, config.dry_run};

    auto runner = approf::ProfileRunner::open(store, command.argument, config.log_dir, executor, user_registry);
    if (!runner) {
        error_inter("{}\n", runner.error());
        return 1;
    }

    ConsoleProgress progress{};
    runner->apply(command.state, &progress);
    runner->conclude();

    std::size_t failed_count{};
    for (const auto& record : runner->trace()) {
        if (!record.result.is_successful()) {
            ++failed_count;
            warning_inter("{} failed for: {}\n", record.op, record.result.failed);
        }
    }
    if (runner->requires_restart()) {
        warning_inter("restart required\n");
    }
    success_inter("Applied profile '{}' ({} operations, {} with failures)\n", runner->profile().name, runner->trace().size(), failed_count);
    return 0;
}

auto run_list(const profilectl::AppConfig& config) noexcept -> std::int32_t {
    const approf::ProfileStore store{config.profiles_dir};
    for (const auto& [profile, summary] : store.summaries()) {
        output_inter("{}\t{}\t{}\n", profile.profile_id, profile.name, summary);
    }
    return 0;
}

auto run_delete(const profilectl::CliCommand& command, const profilectl::AppConfig& config) noexcept -> std::int32_t {
    const approf::ProfileStore store{config.profiles_dir};
    if (!store.remove(command.argument)) {
        error_inter("Failed to delete profile '{}'\n", command.argument);
        return 1;
    }
    return 0;
}

}  // namespace

namespace profilectl {

auto parse_cli(std::span<const std::string_view> args) noexcept -> std::optional<CliCommand> {
    /* clang-format off */
    if (args.empty()) { return std::nullopt; }
    /* clang-format on */

    const auto action = args[0];
    if (action == "list"sv && args.size() == 1) {
        return CliCommand{.action = CliAction::List};
    }
    if (action == "apply"sv && (args.size() == 2 || args.size() == 3)) {
        CliCommand command{.action = CliAction::Apply, .argument = std::string{args[1]}};
        if (args.size() == 3) {
            command.state = std::string{args[2]};
        }
        return command;
    }
    if (action == "delete"sv && args.size() == 2) {
        return CliCommand{.action = CliAction::Delete, .argument = std::string{args[1]}};
    }
    if (action == "id"sv && args.size() == 2) {
        return CliCommand{.action = CliAction::Id, .argument = std::string{args[1]}};
    }
    return std::nullopt;
}

void print_usage() noexcept {
    output_inter("Usage:\n"
                 "  profilectl apply <profile-id> [on|off]\n"
                 "  profilectl list\n"
                 "  profilectl delete <profile-id>\n"
                 "  profilectl id <profile-name>\n");
}

auto run_cli(const CliCommand& command, const AppConfig& config) noexcept -> std::int32_t {
    switch (command.action) {
    case CliAction::Apply:
        return run_apply(command, config);
    case CliAction::List:
        return run_list(config);
    case CliAction::Delete:
        return run_delete(command, config);
    case CliAction::Id:
        output_inter("{}\n", approf::profile_id_for(command.argument));
        return 0;
    }
    return 1;
}

}  // namespace profilectl

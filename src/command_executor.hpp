#ifndef COMMAND_EXECUTOR_HPP
#define COMMAND_EXECUTOR_HPP

#include "config.hpp"

// import approf
#include "approf/collaborators.hpp"

#include <cstddef>      // for size_t
#include <cstdint>      // for int32_t
#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace profilectl {

/// @brief Shell command issued for one target pair.
struct PlannedCommand final {
    std::string package_name{};
    std::int32_t user{};
    std::string command{};

    auto operator==(const PlannedCommand&) const -> bool = default;
};

/// @brief Name of an app-op mode as understood by the appops shell command.
auto app_op_mode_to_string(approf::AppOpMode mode) noexcept -> std::string_view;

/// @brief Runs batched operations as shell commands built from templates.
///
/// Templates use the placeholders {package}, {user}, {component},
/// {permission}, {op}, {mode}, {flags} and {name}. One command is issued per
/// target pair and per component, app op, permission or backup name.
class CommandBatchExecutor final : public approf::BatchExecutor {
 public:
    CommandBatchExecutor(CommandTemplates commands, bool dry_run) noexcept
      : m_commands(std::move(commands)), m_dry_run(dry_run) { }

    auto execute(approf::OpCode op, const approf::Targets& targets, const approf::OperationOptions& options) -> approf::ExecutionResult override;
    void release() noexcept override;

    /// @brief Commands an operation expands to.
    /// @return The commands in target order, or why they cannot be built.
    [[nodiscard]] auto plan(approf::OpCode op, const approf::Targets& targets, const approf::OperationOptions& options) const
        -> std::expected<std::vector<PlannedCommand>, std::string>;

    [[nodiscard]] auto executed_count() const noexcept -> std::size_t { return m_executed_count; }

 private:
    CommandTemplates m_commands{};
    bool m_dry_run{false};
    std::size_t m_executed_count{};
};

}  // namespace profilectl

#endif  // COMMAND_EXECUTOR_HPP

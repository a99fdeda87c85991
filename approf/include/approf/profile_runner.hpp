#ifndef APPROF_PROFILE_RUNNER_HPP
#define APPROF_PROFILE_RUNNER_HPP

#include "approf/collaborators.hpp"
#include "approf/execution_result.hpp"
#include "approf/operation.hpp"
#include "approf/operation_resolver.hpp"
#include "approf/profile.hpp"
#include "approf/profile_logger.hpp"

#include <cstdint>      // for uint8_t
#include <expected>     // for expected
#include <memory>       // for unique_ptr
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace approf {

class ProfileStore;
struct FeatureHandler;
struct Targets;

enum class RunState : std::uint8_t {
    NotStarted,
    Running,
    Concluded,
};

/// @brief Operation issued during a run together with its outcome.
struct OperationRecord final {
    Feature feature{};
    OpCode op{OpCode::None};
    ExecutionResult result{};
};

/// @brief Applies a profile through a batch executor.
///
/// Features run one after another in the order of feature_table(), each at
/// most once. A failing feature is logged and the run moves on to the next
/// one. The only aggregate outcome is requires_restart().
class ProfileRunner final {
 public:
    /// @param profile The profile to apply.
    /// @param executor Performs the batched operations, must outlive the runner.
    /// @param user_registry Supplies users when the profile has none, must outlive the runner.
    /// @param logger Execution log, logging is disabled when null.
    ProfileRunner(Profile profile, BatchExecutor& executor, const UserRegistry& user_registry,
        std::unique_ptr<ProfileLogger> logger = nullptr) noexcept;

    ProfileRunner(ProfileRunner&&) noexcept = default;
    ProfileRunner(const ProfileRunner&)     = delete;
    auto operator=(const ProfileRunner&)    = delete;

    /// @brief Loads a stored profile and opens its execution log.
    ///
    /// A log that cannot be opened only disables logging. Load errors are
    /// written to the execution log and returned.
    /// @param store The profile store.
    /// @param profile_id The profile to load.
    /// @param log_dir Directory of execution logs, logging is disabled when empty.
    /// @param executor Performs the batched operations.
    /// @param user_registry Supplies users when the profile has none.
    /// @return The runner, or why the profile could not be loaded.
    static auto open(const ProfileStore& store, std::string_view profile_id, std::string_view log_dir,
        BatchExecutor& executor, const UserRegistry& user_registry) noexcept -> std::expected<ProfileRunner, std::string>;

    /// @brief Runs every enabled feature of the profile.
    /// @param state Desired state, the profile state when not given.
    /// @param progress Receives the total amount of work before the first operation.
    void apply(std::optional<std::string_view> state = std::nullopt, ProgressSink* progress = nullptr) noexcept;

    // Close the execution log. Safe to call more than once.
    void conclude() noexcept;

    [[nodiscard]] auto requires_restart() const noexcept -> bool { return m_requires_restart; }
    [[nodiscard]] auto run_state() const noexcept -> RunState { return m_run_state; }
    [[nodiscard]] auto trace() const noexcept -> const std::vector<OperationRecord>& { return m_trace; }
    [[nodiscard]] auto profile() const noexcept -> const Profile& { return m_profile; }

 private:
    void run_feature(const FeatureHandler& handler, const Targets& targets, std::string_view state) noexcept;
    void log(std::string_view message) noexcept;

    Profile m_profile;
    BatchExecutor* m_executor;
    const UserRegistry* m_user_registry;
    std::unique_ptr<ProfileLogger> m_logger;

    RunState m_run_state{RunState::NotStarted};
    bool m_requires_restart{false};
    std::vector<OperationRecord> m_trace{};
};

}  // namespace approf

#endif  // APPROF_PROFILE_RUNNER_HPP

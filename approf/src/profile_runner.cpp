#include "approf/profile_runner.hpp"
#include "approf/feature_table.hpp"
#include "approf/profile_store.hpp"
#include "approf/progress.hpp"
#include "approf/targets.hpp"

#include <exception>  // for exception
#include <utility>    // for move

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

namespace approf {

ProfileRunner::ProfileRunner(Profile profile, BatchExecutor& executor, const UserRegistry& user_registry,
    std::unique_ptr<ProfileLogger> logger) noexcept
  : m_profile(std::move(profile)),
    m_executor(&executor),
    m_user_registry(&user_registry),
    m_logger(logger ? std::move(logger) : std::make_unique<NullProfileLogger>()) { }

auto ProfileRunner::open(const ProfileStore& store, std::string_view profile_id, std::string_view log_dir,
    BatchExecutor& executor, const UserRegistry& user_registry) noexcept -> std::expected<ProfileRunner, std::string> {
    std::unique_ptr<ProfileLogger> logger{};
    if (!log_dir.empty()) {
        auto file_logger = FileProfileLogger::open(log_dir, profile_id);
        if (file_logger) {
            logger = std::move(*file_logger);
        } else {
            spdlog::warn("Execution log of profile '{}' is disabled: {}", profile_id, file_logger.error());
        }
    }

    auto profile = store.load(profile_id);
    if (!profile) {
        if (logger) {
            logger->println({}, profile.error());
            logger->close();
        }
        return std::unexpected(std::move(profile.error()));
    }
    return ProfileRunner{std::move(*profile), executor, user_registry, std::move(logger)};
}

void ProfileRunner::apply(std::optional<std::string_view> state, ProgressSink* progress) noexcept {
    if (m_run_state != RunState::NotStarted) {
        spdlog::error("Profile '{}' was already applied", m_profile.profile_id);
        return;
    }
    m_run_state = RunState::Running;

    const std::string effective_state{state.value_or(m_profile.state)};
    log(fmt::format(FMT_COMPILE("====> Started execution with state {}"), effective_state));

    if (m_profile.packages.empty()) {
        spdlog::debug("Profile '{}' has no packages, nothing to do", m_profile.profile_id);
        m_run_state = RunState::Concluded;
        return;
    }

    const auto users   = resolve_users(m_profile.users, *m_user_registry);
    const auto targets = expand_targets(m_profile.packages, users);

    // Send progress
    if (progress != nullptr) {
        progress->set_total(estimate_progress(m_profile, targets.size()), 0);
    }

    for (const auto& handler : feature_table()) {
        run_feature(handler, targets, effective_state);
    }

    log("====> Execution completed.");
    m_executor->release();
    m_run_state = RunState::Concluded;
}

void ProfileRunner::conclude() noexcept {
    m_logger->close();
}

void ProfileRunner::run_feature(const FeatureHandler& handler, const Targets& targets, std::string_view state) noexcept {
    if (!handler.is_enabled(m_profile)) {
        spdlog::debug("Skipped {}.", handler.title);
        return;
    }
    if (!handler.implemented) {
        log(fmt::format(FMT_COMPILE("====> Not implemented {}."), handler.title));
        return;
    }

    log(fmt::format(FMT_COMPILE("====> Started {}. State: {}"), handler.title, state));

    const auto op = resolve(handler.feature, state);
    if (op == OpCode::None) {
        log(fmt::format(FMT_COMPILE("====> No operation for {} in state {}, skipped."), handler.title, state));
        return;
    }

    ExecutionResult result{};
    try {
        const FeatureContext context{
            .profile     = m_profile,
            .state       = state,
            .acting_user = m_user_registry->acting_user_id(),
        };
        result = m_executor->execute(op, targets, handler.build_options(context));
    } catch (const std::exception& ex) {
        m_logger->println(fmt::format("====> Operation {} failed.", op), ex.what());
        spdlog::error("Operation {} of profile '{}' failed: {}", op, m_profile.profile_id, ex.what());
        result = ExecutionResult{.success = false};
    }

    m_requires_restart |= result.requires_restart;
    if (!result.is_successful()) {
        log(fmt::format("====> Failed packages: {}", result.failed));
        spdlog::debug("Failed packages: {}", result);
    }
    m_trace.emplace_back(OperationRecord{.feature = handler.feature, .op = op, .result = std::move(result)});
}

void ProfileRunner::log(std::string_view message) noexcept {
    m_logger->println(message);
}

}  // namespace approf

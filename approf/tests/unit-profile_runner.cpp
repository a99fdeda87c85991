#include "doctest_compatibility.h"

#include "approf/collaborators.hpp"
#include "approf/profile_runner.hpp"
#include "approf/profile_store.hpp"
#include "approf/targets.hpp"

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include <fmt/format.h>

#include <spdlog/sinks/callback_sink.h>
#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_literals;
using namespace std::string_view_literals;

using approf::OpCode;

namespace {

struct ExecutedOperation final {
    OpCode op{};
    approf::Targets targets{};
    approf::OperationOptions options{};
    // progress calls seen before this operation
    std::size_t progress_calls{};
};

class RecordingExecutor final : public approf::BatchExecutor {
 public:
    auto execute(OpCode op, const approf::Targets& targets, const approf::OperationOptions& options) -> approf::ExecutionResult override {
        executed.emplace_back(ExecutedOperation{.op = op, .targets = targets, .options = options, .progress_calls = progress_calls});
        if (throwing.contains(op)) {
            throw std::runtime_error("executor exploded");
        }
        if (auto result = results.find(op); result != results.end()) {
            return result->second;
        }
        return {};
    }
    void release() noexcept override { ++release_count; }

    std::vector<ExecutedOperation> executed{};
    std::map<OpCode, approf::ExecutionResult> results{};
    std::map<OpCode, bool> throwing{};
    std::size_t release_count{};
    std::size_t progress_calls{};
};

class RecordingProgress final : public approf::ProgressSink {
 public:
    explicit RecordingProgress(RecordingExecutor& executor) : m_executor(executor) { }

    void set_total(std::int32_t total, std::int32_t current) noexcept override {
        totals.push_back(total);
        currents.push_back(current);
        ++m_executor.progress_calls;
    }

    std::vector<std::int32_t> totals{};
    std::vector<std::int32_t> currents{};

 private:
    RecordingExecutor& m_executor;
};

class StaticUserRegistry final : public approf::UserRegistry {
 public:
    StaticUserRegistry(std::vector<std::int32_t> users, std::int32_t acting_user)
      : m_users(std::move(users)), m_acting_user(acting_user) { }

    auto all_user_ids() const -> std::vector<std::int32_t> override { return m_users; }
    auto acting_user_id() const noexcept -> std::int32_t override { return m_acting_user; }

 private:
    std::vector<std::int32_t> m_users;
    std::int32_t m_acting_user;
};

struct LogLines final {
    std::vector<std::string> lines{};
    bool closed{false};
};

class RecordingLogger final : public approf::ProfileLogger {
 public:
    explicit RecordingLogger(LogLines& log) : m_log(log) { }

    void println(std::string_view message) noexcept override { m_log.lines.emplace_back(message); }
    void println(std::string_view message, std::string_view cause) noexcept override {
        m_log.lines.emplace_back(fmt::format("{} | {}", message, cause));
    }
    void close() noexcept override { m_log.closed = true; }

 private:
    LogLines& m_log;
};

auto ops_of(const RecordingExecutor& executor) -> std::vector<OpCode> {
    std::vector<OpCode> ops{};
    for (const auto& executed : executor.executed) {
        ops.push_back(executed.op);
    }
    return ops;
}

auto contains_line(const LogLines& log, std::string_view needle) -> bool {
    return std::ranges::any_of(log.lines, [needle](auto&& line) { return line.find(needle) != std::string::npos; });
}

}  // namespace

TEST_CASE("profile runner test")
{
  auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
      // noop
  });
  auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
  spdlog::set_default_logger(logger);

  RecordingExecutor executor{};
  const StaticUserRegistry registry{{0}, 10};

  SECTION("empty packages issue nothing")
  {
    approf::Profile profile{.profile_id = "empty", .name = "empty"};
    profile.components = std::vector<std::string>{"c1"};
    profile.freeze     = true;

    RecordingProgress progress{executor};
    approf::ProfileRunner runner{profile, executor, registry};
    runner.apply(std::nullopt, &progress);

    REQUIRE(executor.executed.empty());
    REQUIRE(progress.totals.empty());
    REQUIRE(!runner.requires_restart());
    REQUIRE_EQ(runner.run_state(), approf::RunState::Concluded);
  }
  SECTION("features run in table order")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a"}};
    profile.users      = std::vector<std::int32_t>{0};
    profile.components = std::vector<std::string>{"com.a/.Ads"};
    profile.freeze     = true;
    profile.clear_data = true;

    approf::ProfileRunner runner{profile, executor, registry};
    runner.apply("on"sv);

    REQUIRE_EQ(ops_of(executor), std::vector{OpCode::BlockComponents, OpCode::Freeze, OpCode::ClearData});
    REQUIRE_EQ(executor.release_count, 1);
    REQUIRE_EQ(runner.trace().size(), 3);
    REQUIRE_EQ(runner.trace()[0].feature, approf::Feature::Components);
  }
  SECTION("off state reverses")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a"}};
    profile.components = std::vector<std::string>{"com.a/.Ads"};
    profile.freeze     = true;
    profile.force_stop = true;

    approf::ProfileRunner runner{profile, executor, registry};
    runner.apply("off"sv);

    REQUIRE_EQ(ops_of(executor), std::vector{OpCode::UnblockComponents, OpCode::Unfreeze, OpCode::ForceStop});
  }
  SECTION("profile state is used when none is given")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .state = "off", .packages = {"com.a"}};
    profile.freeze = true;

    approf::ProfileRunner runner{profile, executor, registry};
    runner.apply();

    REQUIRE_EQ(ops_of(executor), std::vector{OpCode::Unfreeze});
  }
  SECTION("unknown state skips state dependent features")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a"}};
    profile.components = std::vector<std::string>{"com.a/.Ads"};
    profile.app_ops    = std::vector<std::int32_t>{24};
    profile.freeze     = true;
    profile.clear_cache = true;

    approf::ProfileRunner runner{profile, executor, registry};
    runner.apply("maybe"sv);

    REQUIRE_EQ(ops_of(executor), std::vector{OpCode::SetAppOps, OpCode::ClearCache});
    const auto& app_ops_opts = std::get<approf::AppOpsOptions>(executor.executed[0].options);
    REQUIRE_EQ(app_ops_opts.mode, approf::AppOpMode::Default);
  }
  SECTION("targets are the cross product of packages and users")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a", "com.b"}};
    profile.users  = std::vector<std::int32_t>{0, 10};
    profile.freeze = true;

    approf::ProfileRunner runner{profile, executor, registry};
    runner.apply("on"sv);

    REQUIRE_EQ(executor.executed.size(), 1);
    const auto& targets = executor.executed[0].targets;
    REQUIRE_EQ(targets.packages, std::vector<std::string>{"com.a", "com.a", "com.b", "com.b"});
    REQUIRE_EQ(targets.users, std::vector<std::int32_t>{0, 10, 0, 10});
  }
  SECTION("registry users are used when the profile has none")
  {
    const StaticUserRegistry multi_user_registry{{0, 11}, 0};
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a"}};
    profile.freeze = true;

    approf::ProfileRunner runner{profile, executor, multi_user_registry};
    runner.apply("on"sv);

    REQUIRE_EQ(executor.executed[0].targets.users, std::vector<std::int32_t>{0, 11});
  }
  SECTION("named backup restore uses acting user")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a"}};
    profile.backup_data = approf::BackupInfo{.flags = approf::backup_flags::MULTIPLE, .name = "X"};

    {
      approf::ProfileRunner runner{profile, executor, registry};
      runner.apply("off"sv);
    }
    {
      approf::ProfileRunner runner{profile, executor, registry};
      runner.apply("on"sv);
    }

    REQUIRE_EQ(ops_of(executor), std::vector{OpCode::RestoreBackup, OpCode::Backup});
    const auto& restore_opts = std::get<approf::BackupOptions>(executor.executed[0].options);
    REQUIRE_EQ(restore_opts.backup_names, std::vector{"10_X"s});
    const auto& backup_opts = std::get<approf::BackupOptions>(executor.executed[1].options);
    REQUIRE_EQ(backup_opts.backup_names, std::vector{"X"s});
    REQUIRE(approf::backup_flags::has_flag(backup_opts.flags, approf::backup_flags::CUSTOM_USERS));
  }
  SECTION("restart flag is or-ed over every feature")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a"}};
    profile.freeze      = true;
    profile.clear_cache = true;
    executor.results[OpCode::Freeze] = approf::ExecutionResult{.requires_restart = true};

    approf::ProfileRunner runner{profile, executor, registry};
    REQUIRE(!runner.requires_restart());
    runner.apply("on"sv);

    REQUIRE(runner.requires_restart());
    REQUIRE_EQ(executor.executed.size(), 2);
  }
  SECTION("failure does not stop later features")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a", "com.b"}};
    profile.components = std::vector<std::string>{"c1"};
    profile.freeze     = true;
    profile.clear_data = true;
    executor.results[OpCode::BlockComponents] = approf::ExecutionResult{
        .success = false,
        .failed  = {approf::FailedTarget{.package_name = "com.b", .user = 0}},
    };

    LogLines log{};
    approf::ProfileRunner runner{profile, executor, registry, std::make_unique<RecordingLogger>(log)};
    runner.apply("on"sv);

    REQUIRE_EQ(ops_of(executor), std::vector{OpCode::BlockComponents, OpCode::Freeze, OpCode::ClearData});
    REQUIRE(!runner.trace()[0].result.is_successful());
    REQUIRE(runner.trace()[1].result.is_successful());
    REQUIRE(contains_line(log, "com.b:0"sv));
  }
  SECTION("executor exception is contained")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a"}};
    profile.freeze     = true;
    profile.force_stop = true;
    executor.throwing[OpCode::Freeze] = true;

    LogLines log{};
    approf::ProfileRunner runner{profile, executor, registry, std::make_unique<RecordingLogger>(log)};
    runner.apply("on"sv);

    REQUIRE_EQ(ops_of(executor), std::vector{OpCode::Freeze, OpCode::ForceStop});
    REQUIRE_EQ(runner.trace().size(), 2);
    REQUIRE(!runner.trace()[0].result.success);
    REQUIRE(contains_line(log, "executor exploded"sv));
    REQUIRE_EQ(runner.run_state(), approf::RunState::Concluded);
  }
  SECTION("progress is published before the first operation")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a", "com.b"}};
    profile.users      = std::vector<std::int32_t>{0, 10};
    profile.components = std::vector<std::string>{"c1", "c2"};
    profile.freeze     = true;
    profile.export_rules = 1;

    RecordingProgress progress{executor};
    approf::ProfileRunner runner{profile, executor, registry};
    runner.apply("on"sv, &progress);

    REQUIRE_EQ(progress.totals, std::vector<std::int32_t>{8});
    REQUIRE_EQ(progress.currents, std::vector<std::int32_t>{0});
    REQUIRE(!executor.executed.empty());
    REQUIRE_EQ(executor.executed[0].progress_calls, 1);
  }
  SECTION("export rules never reach the executor")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a"}};
    profile.export_rules = 3;

    LogLines log{};
    approf::ProfileRunner runner{profile, executor, registry, std::make_unique<RecordingLogger>(log)};
    runner.apply("on"sv);

    REQUIRE(executor.executed.empty());
    REQUIRE(contains_line(log, "Not implemented export rules"sv));
  }
  SECTION("run applies only once")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a"}};
    profile.freeze = true;

    approf::ProfileRunner runner{profile, executor, registry};
    runner.apply("on"sv);
    runner.apply("off"sv);

    REQUIRE_EQ(ops_of(executor), std::vector{OpCode::Freeze});
  }
  SECTION("execution log lines")
  {
    approf::Profile profile{.profile_id = "p", .name = "p", .packages = {"com.a"}};
    profile.freeze = true;

    LogLines log{};
    approf::ProfileRunner runner{profile, executor, registry, std::make_unique<RecordingLogger>(log)};
    runner.apply("on"sv);
    REQUIRE(!log.closed);
    runner.conclude();

    REQUIRE(log.closed);
    REQUIRE(!log.lines.empty());
    REQUIRE_EQ(log.lines.front(), "====> Started execution with state on");
    REQUIRE(contains_line(log, "====> Started freeze/unfreeze. State: on"sv));
    REQUIRE_EQ(log.lines.back(), "====> Execution completed.");
  }
}

TEST_CASE("profile runner open test")
{
  auto callback_sink = std::make_shared<spdlog::sinks::callback_sink_mt>([](const spdlog::details::log_msg&) {
      // noop
  });
  auto logger        = std::make_shared<spdlog::logger>("default", callback_sink);
  spdlog::set_default_logger(logger);

  const auto& tmp_dir = fs::temp_directory_path() / "approf-runner-test";
  fs::remove_all(tmp_dir);
  const auto& profiles_dir = (tmp_dir / "profiles").string();
  const auto& log_dir      = (tmp_dir / "logs").string();

  RecordingExecutor executor{};
  const StaticUserRegistry registry{{0}, 0};
  const approf::ProfileStore store{profiles_dir};

  SECTION("missing profile")
  {
    auto runner = approf::ProfileRunner::open(store, "missing"sv, log_dir, executor, registry);
    REQUIRE(!runner.has_value());
    REQUIRE(runner.error().find("does not exist") != std::string::npos);
    // the failure lands in the execution log
    REQUIRE(fs::exists(approf::FileProfileLogger::log_path(log_dir, "missing"sv)));
  }
  SECTION("stored profile")
  {
    approf::Profile profile{.profile_id = "stored", .name = "Stored", .packages = {"com.a"}};
    profile.force_stop = true;
    REQUIRE(store.save(profile));

    auto runner = approf::ProfileRunner::open(store, "stored"sv, log_dir, executor, registry);
    REQUIRE(runner.has_value());
    REQUIRE_EQ(runner->profile(), profile);

    runner->apply();
    runner->conclude();
    REQUIRE_EQ(ops_of(executor), std::vector{OpCode::ForceStop});
    REQUIRE(fs::exists(approf::FileProfileLogger::log_path(log_dir, "stored"sv)));
  }
  SECTION("logging disabled")
  {
    approf::Profile profile{.profile_id = "nolog", .name = "No log", .packages = {"com.a"}};
    REQUIRE(store.save(profile));

    auto runner = approf::ProfileRunner::open(store, "nolog"sv, ""sv, executor, registry);
    REQUIRE(runner.has_value());
    runner->apply();
    REQUIRE_EQ(runner->run_state(), approf::RunState::Concluded);
  }

  fs::remove_all(tmp_dir);
}

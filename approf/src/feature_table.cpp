#include "approf/feature_table.hpp"

#include <algorithm>  // for find_if
#include <array>      // for array

#include <fmt/compile.h>
#include <fmt/format.h>

using namespace std::string_view_literals;

namespace {

using approf::Feature;
using approf::FeatureContext;
using approf::FeatureHandler;
using approf::OperationOptions;
using approf::Profile;

auto no_options(const FeatureContext&) -> OperationOptions {
    return std::monostate{};
}

constexpr std::array FEATURE_HANDLERS{
    FeatureHandler{
        .feature       = Feature::Components,
        .title         = "block/unblock components"sv,
        .implemented   = true,
        .is_enabled    = [](const Profile& profile) noexcept { return profile.components.has_value(); },
        .build_options = [](const FeatureContext& ctx) -> OperationOptions {
            return approf::ComponentOptions{.components = *ctx.profile.components};
        },
    },
    FeatureHandler{
        .feature       = Feature::AppOps,
        .title         = "ignore/default app ops"sv,
        .implemented   = true,
        .is_enabled    = [](const Profile& profile) noexcept { return profile.app_ops.has_value(); },
        .build_options = [](const FeatureContext& ctx) -> OperationOptions {
            return approf::AppOpsOptions{.app_ops = *ctx.profile.app_ops, .mode = approf::resolve_app_op_mode(ctx.state)};
        },
    },
    FeatureHandler{
        .feature       = Feature::Permissions,
        .title         = "grant/revoke permissions"sv,
        .implemented   = true,
        .is_enabled    = [](const Profile& profile) noexcept { return profile.permissions.has_value(); },
        .build_options = [](const FeatureContext& ctx) -> OperationOptions {
            return approf::PermissionOptions{.permissions = *ctx.profile.permissions};
        },
    },
    FeatureHandler{
        .feature       = Feature::ExportRules,
        .title         = "export rules"sv,
        .implemented   = false,
        .is_enabled    = [](const Profile& profile) noexcept { return profile.export_rules.has_value(); },
        .build_options = no_options,
    },
    FeatureHandler{
        .feature       = Feature::Freeze,
        .title         = "freeze/unfreeze"sv,
        .implemented   = true,
        .is_enabled    = [](const Profile& profile) noexcept { return profile.freeze; },
        .build_options = no_options,
    },
    FeatureHandler{
        .feature       = Feature::ForceStop,
        .title         = "force-stop"sv,
        .implemented   = true,
        .is_enabled    = [](const Profile& profile) noexcept { return profile.force_stop; },
        .build_options = no_options,
    },
    FeatureHandler{
        .feature       = Feature::ClearCache,
        .title         = "clear cache"sv,
        .implemented   = true,
        .is_enabled    = [](const Profile& profile) noexcept { return profile.clear_cache; },
        .build_options = no_options,
    },
    FeatureHandler{
        .feature       = Feature::ClearData,
        .title         = "clear data"sv,
        .implemented   = true,
        .is_enabled    = [](const Profile& profile) noexcept { return profile.clear_data; },
        .build_options = no_options,
    },
    FeatureHandler{
        .feature       = Feature::BlockTrackers,
        .title         = "block/unblock trackers"sv,
        .implemented   = true,
        .is_enabled    = [](const Profile& profile) noexcept { return profile.block_trackers; },
        .build_options = no_options,
    },
    FeatureHandler{
        .feature       = Feature::SaveApk,
        .title         = "backup apk"sv,
        .implemented   = true,
        .is_enabled    = [](const Profile& profile) noexcept { return profile.save_apk; },
        .build_options = no_options,
    },
    FeatureHandler{
        .feature       = Feature::BackupData,
        .title         = "backup/restore"sv,
        .implemented   = true,
        .is_enabled    = [](const Profile& profile) noexcept { return profile.backup_data.has_value(); },
        .build_options = [](const FeatureContext& ctx) -> OperationOptions {
            return approf::build_backup_options(*ctx.profile.backup_data, ctx.state, ctx.acting_user);
        },
    },
};

}  // namespace

namespace approf {

auto feature_table() noexcept -> std::span<const FeatureHandler> {
    return FEATURE_HANDLERS;
}

auto find_feature_handler(Feature feature) noexcept -> const FeatureHandler& {
    // every feature has exactly one handler
    return *std::ranges::find_if(FEATURE_HANDLERS, [feature](auto&& handler) { return handler.feature == feature; });
}

auto build_backup_options(const BackupInfo& backup_info, std::string_view state, std::int32_t acting_user) -> BackupOptions {
    BackupOptions options{};
    if (backup_flags::has_flag(backup_info.flags, backup_flags::MULTIPLE) && backup_info.name.has_value()) {
        if (state == STATE_OFF) {
            options.backup_names.emplace_back(fmt::format(FMT_COMPILE("{}_{}"), acting_user, *backup_info.name));
        } else {
            options.backup_names.emplace_back(*backup_info.name);
        }
    }
    // targets are always resolved per user
    options.flags = backup_info.flags | backup_flags::CUSTOM_USERS;
    return options;
}

}  // namespace approf

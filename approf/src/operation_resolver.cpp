#include "approf/operation_resolver.hpp"
#include "approf/profile.hpp"

#include <algorithm>  // for find_if
#include <array>      // for array

using namespace std::string_view_literals;

namespace {

struct StateMapping final {
    approf::Feature feature;
    approf::OpCode on_op;
    approf::OpCode off_op;
    approf::OpCode other_op;
};

using approf::Feature;
using approf::OpCode;

// clang-format off
constexpr std::array STATE_MAPPINGS{
    StateMapping{Feature::Components,    OpCode::BlockComponents,   OpCode::UnblockComponents, OpCode::None},
    StateMapping{Feature::AppOps,        OpCode::SetAppOps,         OpCode::SetAppOps,         OpCode::SetAppOps},
    StateMapping{Feature::Permissions,   OpCode::RevokePermissions, OpCode::GrantPermissions,  OpCode::None},
    StateMapping{Feature::ExportRules,   OpCode::None,              OpCode::None,              OpCode::None},
    StateMapping{Feature::Freeze,        OpCode::Freeze,            OpCode::Unfreeze,          OpCode::None},
    StateMapping{Feature::ForceStop,     OpCode::ForceStop,         OpCode::ForceStop,         OpCode::ForceStop},
    StateMapping{Feature::ClearCache,    OpCode::ClearCache,        OpCode::ClearCache,        OpCode::ClearCache},
    StateMapping{Feature::ClearData,     OpCode::ClearData,         OpCode::ClearData,         OpCode::ClearData},
    StateMapping{Feature::BlockTrackers, OpCode::BlockTrackers,     OpCode::UnblockTrackers,   OpCode::None},
    StateMapping{Feature::SaveApk,       OpCode::BackupApk,         OpCode::BackupApk,         OpCode::BackupApk},
    StateMapping{Feature::BackupData,    OpCode::Backup,            OpCode::RestoreBackup,     OpCode::None},
};
// clang-format on

}  // namespace

namespace approf {

auto feature_to_string(Feature feature) noexcept -> std::string_view {
    switch (feature) {
    case Feature::Components:
        return "components"sv;
    case Feature::AppOps:
        return "app_ops"sv;
    case Feature::Permissions:
        return "permissions"sv;
    case Feature::ExportRules:
        return "export_rules"sv;
    case Feature::Freeze:
        return "freeze"sv;
    case Feature::ForceStop:
        return "force_stop"sv;
    case Feature::ClearCache:
        return "clear_cache"sv;
    case Feature::ClearData:
        return "clear_data"sv;
    case Feature::BlockTrackers:
        return "block_trackers"sv;
    case Feature::SaveApk:
        return "save_apk"sv;
    case Feature::BackupData:
        return "backup_data"sv;
    }
    return "unknown"sv;
}

auto resolve(Feature feature, std::string_view state) noexcept -> OpCode {
    const auto mapping = std::ranges::find_if(STATE_MAPPINGS, [feature](auto&& entry) { return entry.feature == feature; });
    /* clang-format off */
    if (mapping == STATE_MAPPINGS.end()) { return OpCode::None; }
    /* clang-format on */

    if (state == STATE_ON) {
        return mapping->on_op;
    } else if (state == STATE_OFF) {
        return mapping->off_op;
    }
    return mapping->other_op;
}

auto resolve_app_op_mode(std::string_view state) noexcept -> AppOpMode {
    if (state == STATE_ON) {
        return AppOpMode::Ignored;
    }
    return AppOpMode::Default;
}

}  // namespace approf

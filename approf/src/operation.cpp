#include "approf/operation.hpp"

using namespace std::string_view_literals;

namespace approf {

auto op_code_to_string(OpCode op) noexcept -> std::string_view {
    switch (op) {
    case OpCode::None:
        return "none"sv;
    case OpCode::BlockComponents:
        return "block_components"sv;
    case OpCode::UnblockComponents:
        return "unblock_components"sv;
    case OpCode::SetAppOps:
        return "set_app_ops"sv;
    case OpCode::RevokePermissions:
        return "revoke_permissions"sv;
    case OpCode::GrantPermissions:
        return "grant_permissions"sv;
    case OpCode::Freeze:
        return "freeze"sv;
    case OpCode::Unfreeze:
        return "unfreeze"sv;
    case OpCode::ForceStop:
        return "force_stop"sv;
    case OpCode::ClearCache:
        return "clear_cache"sv;
    case OpCode::ClearData:
        return "clear_data"sv;
    case OpCode::BlockTrackers:
        return "block_trackers"sv;
    case OpCode::UnblockTrackers:
        return "unblock_trackers"sv;
    case OpCode::BackupApk:
        return "backup_apk"sv;
    case OpCode::Backup:
        return "backup"sv;
    case OpCode::RestoreBackup:
        return "restore_backup"sv;
    }
    return "unknown"sv;
}

auto op_code_from_string(std::string_view op_name) noexcept -> std::optional<OpCode> {
    for (auto op = static_cast<std::uint8_t>(OpCode::None); op <= static_cast<std::uint8_t>(OpCode::RestoreBackup); ++op) {
        if (op_code_to_string(static_cast<OpCode>(op)) == op_name) {
            return static_cast<OpCode>(op);
        }
    }
    return std::nullopt;
}

}  // namespace approf

#ifndef APPROF_OPERATION_HPP
#define APPROF_OPERATION_HPP

#include <cstdint>      // for int32_t, uint8_t, uint32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <variant>      // for variant, monostate
#include <vector>       // for vector

#include <fmt/format.h>

namespace approf {

/// @brief Batched actions understood by a BatchExecutor.
enum class OpCode : std::uint8_t {
    None,
    BlockComponents,
    UnblockComponents,
    SetAppOps,
    RevokePermissions,
    GrantPermissions,
    Freeze,
    Unfreeze,
    ForceStop,
    ClearCache,
    ClearData,
    BlockTrackers,
    UnblockTrackers,
    BackupApk,
    Backup,
    RestoreBackup,
};

/// @brief Converts operation code to its stable string name.
/// @param op The operation code.
/// @return snake_case name, e.g "block_components".
auto op_code_to_string(OpCode op) noexcept -> std::string_view;

/// @brief Converts a string name back to the operation code.
/// @return The operation code or std::nullopt if invalid.
auto op_code_from_string(std::string_view op_name) noexcept -> std::optional<OpCode>;

/// @brief App-op modes, values match the platform AppOpsManager.
enum class AppOpMode : std::int32_t {
    Allowed    = 0,
    Ignored    = 1,
    Errored    = 2,
    Default    = 3,
    Foreground = 4,
};

namespace backup_flags {

inline constexpr std::uint32_t NOTHING        = 0;
inline constexpr std::uint32_t APK_FILES      = 1U << 0;
inline constexpr std::uint32_t INT_DATA       = 1U << 1;
inline constexpr std::uint32_t EXT_DATA       = 1U << 2;
inline constexpr std::uint32_t EXTRAS         = 1U << 3;
inline constexpr std::uint32_t RULES          = 1U << 4;
inline constexpr std::uint32_t MULTIPLE       = 1U << 6;
inline constexpr std::uint32_t CACHE          = 1U << 7;
inline constexpr std::uint32_t ADB_DATA       = 1U << 8;
inline constexpr std::uint32_t CUSTOM_USERS   = 1U << 9;
inline constexpr std::uint32_t EXT_OBB_MEDIA  = 1U << 10;
inline constexpr std::uint32_t SKIP_SIGNATURE = 1U << 11;

constexpr auto has_flag(std::uint32_t flags, std::uint32_t flag) noexcept -> bool {
    return (flags & flag) == flag;
}

}  // namespace backup_flags

struct ComponentOptions final {
    std::vector<std::string> components{};

    auto operator==(const ComponentOptions&) const -> bool = default;
};

struct AppOpsOptions final {
    std::vector<std::int32_t> app_ops{};
    AppOpMode mode{AppOpMode::Default};

    auto operator==(const AppOpsOptions&) const -> bool = default;
};

struct PermissionOptions final {
    std::vector<std::string> permissions{};

    auto operator==(const PermissionOptions&) const -> bool = default;
};

struct BackupOptions final {
    std::uint32_t flags{backup_flags::NOTHING};
    /// Empty when the executor should pick the default backup name.
    std::vector<std::string> backup_names{};

    auto operator==(const BackupOptions&) const -> bool = default;
};

/// Operation-specific parameters, monostate for parameterless operations.
using OperationOptions = std::variant<std::monostate, ComponentOptions, AppOpsOptions, PermissionOptions, BackupOptions>;

}  // namespace approf

template <>
struct fmt::formatter<approf::OpCode> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(approf::OpCode op, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(approf::op_code_to_string(op), ctx);
    }
};

#endif  // APPROF_OPERATION_HPP

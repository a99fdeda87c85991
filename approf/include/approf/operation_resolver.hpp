#ifndef APPROF_OPERATION_RESOLVER_HPP
#define APPROF_OPERATION_RESOLVER_HPP

#include "approf/operation.hpp"

#include <cstdint>      // for uint8_t
#include <string_view>  // for string_view

#include <fmt/format.h>

namespace approf {

/// @brief Independently toggleable aspects of a profile, in execution order.
enum class Feature : std::uint8_t {
    Components,
    AppOps,
    Permissions,
    ExportRules,
    Freeze,
    ForceStop,
    ClearCache,
    ClearData,
    BlockTrackers,
    SaveApk,
    BackupData,
};

auto feature_to_string(Feature feature) noexcept -> std::string_view;

/// @brief Maps a feature and a desired state onto the operation to issue.
///
/// State-dependent features yield OpCode::None for any state other than
/// "on" and "off". Export rules always yield OpCode::None.
/// @param feature The feature to resolve.
/// @param state The desired state.
/// @return The operation code.
[[nodiscard]] auto resolve(Feature feature, std::string_view state) noexcept -> OpCode;

/// @brief App-op mode for the desired state: "on" ignores, anything else resets to default.
[[nodiscard]] auto resolve_app_op_mode(std::string_view state) noexcept -> AppOpMode;

}  // namespace approf

template <>
struct fmt::formatter<approf::Feature> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(approf::Feature feature, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::formatter<std::string_view>::format(approf::feature_to_string(feature), ctx);
    }
};

#endif  // APPROF_OPERATION_RESOLVER_HPP

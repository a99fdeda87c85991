#ifndef APPROF_FEATURE_TABLE_HPP
#define APPROF_FEATURE_TABLE_HPP

#include "approf/operation.hpp"
#include "approf/operation_resolver.hpp"
#include "approf/profile.hpp"

#include <cstdint>      // for int32_t
#include <span>         // for span
#include <string_view>  // for string_view

namespace approf {

/// @brief Inputs available when building operation options.
struct FeatureContext final {
    const Profile& profile;
    std::string_view state;
    std::int32_t acting_user{};
};

/// @brief Describes how one profile feature turns into an operation.
struct FeatureHandler final {
    using EnabledFn = bool (*)(const Profile&) noexcept;
    using OptionsFn = OperationOptions (*)(const FeatureContext&);

    Feature feature;
    /// Shown in execution logs, e.g "freeze/unfreeze".
    std::string_view title;
    /// Inert features are logged but never issue an operation.
    bool implemented;
    EnabledFn is_enabled;
    OptionsFn build_options;
};

/// @brief Every feature handler in execution order.
///
/// Components, app ops, permissions, export rules, freeze, force-stop,
/// clear cache, clear data, block trackers, backup apk, backup/restore data.
auto feature_table() noexcept -> std::span<const FeatureHandler>;

/// @brief Finds the handler of a feature.
auto find_feature_handler(Feature feature) noexcept -> const FeatureHandler&;

/// @brief Backup options for a backup/restore request.
///
/// CUSTOM_USERS is always added. With MULTIPLE and a name, the restore
/// ("off") reads the acting user's backup "<user>_<name>", every other
/// state uses the name as is.
/// @param backup_info The backup request of the profile.
/// @param state The desired state.
/// @param acting_user The user the engine runs as.
/// @return The options passed to the executor.
auto build_backup_options(const BackupInfo& backup_info, std::string_view state, std::int32_t acting_user) -> BackupOptions;

}  // namespace approf

#endif  // APPROF_FEATURE_TABLE_HPP

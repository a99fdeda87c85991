#ifndef APPROF_PROFILE_HPP
#define APPROF_PROFILE_HPP

#include <cstdint>      // for int32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace approf {

inline constexpr std::string_view STATE_ON  = "on";
inline constexpr std::string_view STATE_OFF = "off";

/// Profile types known to the document format.
inline constexpr std::int32_t PROFILE_TYPE_APPS = 0;

inline constexpr std::int32_t PROFILE_VERSION = 1;

/// @brief Backup or restore request of a profile.
struct BackupInfo final {
    /// Combination of backup_flags values.
    std::uint32_t flags{};
    /// Backup name, only meaningful together with backup_flags::MULTIPLE.
    std::optional<std::string> name{};

    auto operator==(const BackupInfo&) const -> bool = default;
};

/// @brief Declarative desired state for a set of applications.
///
/// Optional collections are absent when the document does not carry them.
/// An absent collection disables its feature, an empty one does not.
struct Profile final {
    std::string profile_id{};
    std::string name{};
    std::int32_t type{PROFILE_TYPE_APPS};
    std::int32_t version{PROFILE_VERSION};
    bool allow_routine{false};
    std::optional<std::string> comment{};

    /// "on" or "off", any other value is kept as is.
    std::string state{STATE_ON};
    std::vector<std::string> packages{};
    /// All users known to the system when absent.
    std::optional<std::vector<std::int32_t>> users{};

    std::optional<std::vector<std::string>> components{};
    std::optional<std::vector<std::int32_t>> app_ops{};
    std::optional<std::vector<std::string>> permissions{};
    std::optional<std::int32_t> export_rules{};

    bool freeze{false};
    bool force_stop{false};
    bool clear_cache{false};
    bool clear_data{false};
    bool block_trackers{false};
    bool save_apk{false};

    std::optional<BackupInfo> backup_data{};

    auto operator==(const Profile&) const -> bool = default;
};

}  // namespace approf

#endif  // APPROF_PROFILE_HPP

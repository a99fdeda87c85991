#ifndef APPROF_PROFILE_STORE_HPP
#define APPROF_PROFILE_STORE_HPP

#include "approf/profile.hpp"

#include <expected>     // for expected
#include <stop_token>   // for stop_token
#include <string>       // for string
#include <string_view>  // for string_view
#include <utility>      // for move
#include <vector>       // for vector

namespace approf {

inline constexpr std::string_view PROFILE_EXT = ".am.json";

/// @brief Profile with a one-line description of what it does.
struct ProfileSummary final {
    Profile profile{};
    std::string summary{};
};

/// @brief One-line description of the enabled features, e.g "components, freeze, clear data".
auto describe_profile(const Profile& profile) noexcept -> std::string;

/// @brief Strips ".am.json", or failing that ".json", from a file name.
auto profile_name_from_filename(std::string_view filename) noexcept -> std::string;

/// @brief File-name safe identifier of a profile name.
///
/// Spaces and characters illegal on unix or FAT file systems are replaced with
/// '_'. A random UUID is returned when nothing usable remains.
auto profile_id_for(std::string_view profile_name) noexcept -> std::string;

/// @brief Directory of profile documents, one "<profile_id>.am.json" file each.
class ProfileStore final {
 public:
    explicit ProfileStore(std::string profiles_dir) noexcept : m_profiles_dir(std::move(profiles_dir)) { }

    [[nodiscard]] auto profiles_dir() const noexcept -> std::string_view { return m_profiles_dir; }

    [[nodiscard]] auto path_for(std::string_view profile_id) const noexcept -> std::string;

    /// @brief Loads a profile by its identifier.
    /// @return The profile, or why it could not be read or parsed.
    [[nodiscard]] auto load(std::string_view profile_id) const noexcept -> std::expected<Profile, std::string>;

    /// @brief Loads a profile from an explicit path.
    [[nodiscard]] auto load_path(std::string_view filepath, std::string_view profile_id) const noexcept -> std::expected<Profile, std::string>;

    /// @brief Writes a profile, creating the directory when missing.
    auto save(const Profile& profile) const noexcept -> bool;

    /// @return true when the profile file is absent or was deleted.
    auto remove(std::string_view profile_id) const noexcept -> bool;

    /// @brief Identifiers of every stored profile, sorted.
    [[nodiscard]] auto list_names() const noexcept -> std::vector<std::string>;

    /// @brief Every profile that loads, unreadable documents are logged and skipped.
    [[nodiscard]] auto list() const noexcept -> std::vector<Profile>;

    /// @brief Profiles with their summaries.
    ///
    /// Stops early and returns what was gathered when a stop is requested.
    [[nodiscard]] auto summaries(std::stop_token stop_token = {}) const noexcept -> std::vector<ProfileSummary>;

 private:
    std::string m_profiles_dir{};
};

}  // namespace approf

#endif  // APPROF_PROFILE_STORE_HPP

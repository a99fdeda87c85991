#include "approf/profile_store.hpp"
#include "approf/feature_table.hpp"
#include "approf/file_utils.hpp"
#include "approf/profile_json.hpp"
#include "approf/string_utils.hpp"

#include <algorithm>     // for sort
#include <cstdint>       // for uint64_t
#include <filesystem>    // for directory_iterator, exists, remove
#include <random>        // for random_device, mt19937_64
#include <system_error>  // for error_code

#include <fmt/compile.h>
#include <fmt/format.h>
#include <fmt/ranges.h>

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_view_literals;

namespace {

auto random_uuid() noexcept -> std::string {
    std::random_device rd{};
    std::mt19937_64 gen{(static_cast<std::uint64_t>(rd()) << 32U) | rd()};
    const auto high = gen();
    const auto low  = gen();

    // version 4, variant 1
    return fmt::format(FMT_COMPILE("{:08x}-{:04x}-4{:03x}-{:04x}-{:012x}"),
        high >> 32U, (high >> 16U) & 0xffffU, high & 0x0fffU,
        ((low >> 48U) & 0x3fffU) | 0x8000U, low & 0xffffffffffffU);
}

}  // namespace

namespace approf {

auto describe_profile(const Profile& profile) noexcept -> std::string {
    std::vector<std::string_view> features{};
    for (const auto& handler : feature_table()) {
        if (handler.implemented && handler.is_enabled(profile)) {
            features.push_back(handler.title);
        }
    }
    if (features.empty()) {
        return fmt::format(FMT_COMPILE("{} packages, no operations"), profile.packages.size());
    }
    return fmt::format(FMT_COMPILE("{} packages: {}"), profile.packages.size(), fmt::join(features, ", "));
}

auto profile_name_from_filename(std::string_view filename) noexcept -> std::string {
    auto index = filename.find(PROFILE_EXT);
    if (index == std::string_view::npos) {
        // Maybe only ends with .json
        index = filename.find(".json"sv);
    }
    return std::string{(index != std::string_view::npos) ? filename.substr(0, index) : filename};
}

auto profile_id_for(std::string_view profile_name) noexcept -> std::string {
    namespace flags = utils::sanitize_flags;

    auto profile_id = utils::sanitize_filename(profile_name, "_"sv,
        flags::SPACE | flags::UNIX_ILLEGAL_CHARS | flags::UNIX_RESERVED | flags::FAT_ILLEGAL_CHARS);
    if (!profile_id) {
        return random_uuid();
    }
    return std::move(*profile_id);
}

auto ProfileStore::path_for(std::string_view profile_id) const noexcept -> std::string {
    return fmt::format(FMT_COMPILE("{}/{}{}"), m_profiles_dir, profile_id, PROFILE_EXT);
}

auto ProfileStore::load(std::string_view profile_id) const noexcept -> std::expected<Profile, std::string> {
    return load_path(path_for(profile_id), profile_id);
}

auto ProfileStore::load_path(std::string_view filepath, std::string_view profile_id) const noexcept -> std::expected<Profile, std::string> {
    std::error_code err{};
    if (!fs::exists(filepath, err)) {
        return std::unexpected(fmt::format(FMT_COMPILE("Profile '{}' does not exist at '{}'"), profile_id, filepath));
    }

    const auto& content = file_utils::read_whole_file(filepath);
    if (!content) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to read profile '{}'"), filepath));
    }

    auto profile = parse_profile(*content, profile_id);
    if (!profile) {
        return std::unexpected(fmt::format(FMT_COMPILE("Failed to parse profile '{}': {}"), filepath, profile.error()));
    }
    return profile;
}

auto ProfileStore::save(const Profile& profile) const noexcept -> bool {
    std::error_code err{};
    fs::create_directories(m_profiles_dir, err);
    if (err) {
        spdlog::error("Failed to create profiles directory '{}': {}", m_profiles_dir, err.message());
        return false;
    }
    return file_utils::create_file_for_overwrite(path_for(profile.profile_id), serialize_profile(profile));
}

auto ProfileStore::remove(std::string_view profile_id) const noexcept -> bool {
    const auto& profile_path = path_for(profile_id);

    std::error_code err{};
    if (!fs::exists(profile_path, err)) {
        return true;
    }
    if (!fs::remove(profile_path, err)) {
        spdlog::error("Failed to delete profile '{}': {}", profile_path, err.message());
        return false;
    }
    return true;
}

auto ProfileStore::list_names() const noexcept -> std::vector<std::string> {
    std::vector<std::string> profile_names{};

    std::error_code err{};
    for (const auto& dir_entry : fs::directory_iterator{m_profiles_dir, err}) {
        std::error_code entry_err{};
        const auto& filename = dir_entry.path().filename().string();
        if (dir_entry.is_regular_file(entry_err) && filename.ends_with(PROFILE_EXT)) {
            profile_names.emplace_back(profile_name_from_filename(filename));
        }
    }
    if (err) {
        spdlog::debug("Cannot list profiles in '{}': {}", m_profiles_dir, err.message());
    }

    std::ranges::sort(profile_names);
    return profile_names;
}

auto ProfileStore::list() const noexcept -> std::vector<Profile> {
    std::vector<Profile> profiles{};
    for (const auto& profile_id : list_names()) {
        auto profile = load(profile_id);
        if (!profile) {
            spdlog::warn("Skipping profile '{}': {}", profile_id, profile.error());
            continue;
        }
        profiles.emplace_back(std::move(*profile));
    }
    return profiles;
}

auto ProfileStore::summaries(std::stop_token stop_token) const noexcept -> std::vector<ProfileSummary> {
    std::vector<ProfileSummary> profile_summaries{};
    for (const auto& profile_id : list_names()) {
        if (stop_token.stop_requested()) {
            // Interrupted, return as is
            return profile_summaries;
        }
        auto profile = load(profile_id);
        if (!profile) {
            spdlog::warn("Skipping profile '{}': {}", profile_id, profile.error());
            continue;
        }
        auto summary = describe_profile(*profile);
        profile_summaries.emplace_back(ProfileSummary{.profile = std::move(*profile), .summary = std::move(summary)});
    }
    return profile_summaries;
}

}  // namespace approf

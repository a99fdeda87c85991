#include "user_registry.hpp"

#include <unistd.h>  // for getuid

#include <algorithm>     // for sort
#include <charconv>      // for from_chars
#include <filesystem>    // for directory_iterator
#include <system_error>  // for error_code

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

using namespace std::string_view_literals;

namespace {

// uid range reserved per user
constexpr std::int32_t PER_USER_RANGE = 100000;

auto parse_user_id(std::string_view filename) noexcept -> std::optional<std::int32_t> {
    /* clang-format off */
    if (!filename.ends_with(".xml"sv)) { return std::nullopt; }
    /* clang-format on */
    filename.remove_suffix(".xml"sv.size());

    std::int32_t user_id{};
    const auto [ptr, ec] = std::from_chars(filename.data(), filename.data() + filename.size(), user_id);
    if (ec != std::errc{} || ptr != filename.data() + filename.size() || user_id < 0) {
        return std::nullopt;
    }
    return user_id;
}

}  // namespace

namespace profilectl {

auto SystemUserRegistry::all_user_ids() const -> std::vector<std::int32_t> {
    if (m_configured_users) {
        return *m_configured_users;
    }

    std::vector<std::int32_t> user_ids{};
    std::error_code err{};
    for (const auto& dir_entry : fs::directory_iterator{m_users_dir, err}) {
        if (auto user_id = parse_user_id(dir_entry.path().filename().string())) {
            user_ids.push_back(*user_id);
        }
    }
    if (user_ids.empty()) {
        spdlog::debug("No users found in '{}', falling back to user 0", m_users_dir);
        return {0};
    }

    std::ranges::sort(user_ids);
    return user_ids;
}

auto SystemUserRegistry::acting_user_id() const noexcept -> std::int32_t {
    return static_cast<std::int32_t>(getuid()) / PER_USER_RANGE;
}

}  // namespace profilectl

#include "approf/progress.hpp"
#include "approf/feature_table.hpp"

#include <algorithm>  // for count_if

namespace approf {

auto count_enabled_features(const Profile& profile) noexcept -> std::int32_t {
    const auto& functor = [&profile](auto&& handler) { return handler.implemented && handler.is_enabled(profile); };
    return static_cast<std::int32_t>(std::ranges::count_if(feature_table(), functor));
}

auto estimate_progress(const Profile& profile, std::size_t target_count) noexcept -> std::int32_t {
    return count_enabled_features(profile) * static_cast<std::int32_t>(target_count);
}

}  // namespace approf

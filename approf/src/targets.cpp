#include "approf/targets.hpp"
#include "approf/collaborators.hpp"

#if defined(__clang__)
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(__GNUC__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#pragma GCC diagnostic ignored "-Wuseless-cast"
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif

#include <range/v3/view/cartesian_product.hpp>

#if defined(__clang__)
#pragma clang diagnostic pop
#elif defined(__GNUC__)
#pragma GCC diagnostic pop
#endif

namespace approf {

auto expand_targets(const std::vector<std::string>& packages, const std::vector<std::int32_t>& users) noexcept -> Targets {
    Targets targets{};
    const auto size = packages.size() * users.size();
    targets.packages.reserve(size);
    targets.users.reserve(size);

    for (auto&& [package_name, user] : ranges::views::cartesian_product(packages, users)) {
        targets.packages.emplace_back(package_name);
        targets.users.push_back(user);
    }
    return targets;
}

auto resolve_users(const std::optional<std::vector<std::int32_t>>& users, const UserRegistry& registry) -> std::vector<std::int32_t> {
    if (users.has_value()) {
        return *users;
    }
    return registry.all_user_ids();
}

}  // namespace approf

#ifndef APPROF_TARGETS_HPP
#define APPROF_TARGETS_HPP

#include <cstddef>   // for size_t
#include <cstdint>   // for int32_t
#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

#include <fmt/format.h>

namespace approf {

class UserRegistry;

/// @brief Cross-product of packages and users an operation applies to.
///
/// Row i is the target pair (packages[i], users[i]).
struct Targets final {
    std::vector<std::string> packages{};
    std::vector<std::int32_t> users{};

    [[nodiscard]] auto size() const noexcept -> std::size_t { return packages.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return packages.empty(); }

    auto operator==(const Targets&) const -> bool = default;
};

/// @brief Builds every (package, user) pair, packages outer and users inner.
/// @param packages The packages in profile order, duplicates are kept.
/// @param users The users each package applies to.
/// @return Targets with packages.size() * users.size() rows.
auto expand_targets(const std::vector<std::string>& packages, const std::vector<std::int32_t>& users) noexcept -> Targets;

/// @brief Users a profile applies to.
/// @param users The users declared by the profile, if any.
/// @param registry Source of all users known to the system.
/// @return The declared users, or every user of the registry when none are declared.
auto resolve_users(const std::optional<std::vector<std::int32_t>>& users, const UserRegistry& registry) -> std::vector<std::int32_t>;

}  // namespace approf

template <>
struct fmt::formatter<approf::Targets> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const approf::Targets& targets, FormatContext& ctx) const -> decltype(ctx.out()) {
        auto out = fmt::format_to(ctx.out(), "[");
        for (std::size_t i = 0; i < targets.size(); ++i) {
            out = fmt::format_to(out, "{}{}:{}", (i == 0) ? "" : ", ", targets.packages[i], targets.users[i]);
        }
        return fmt::format_to(out, "]");
    }
};

#endif  // APPROF_TARGETS_HPP

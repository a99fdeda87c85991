#ifndef USER_REGISTRY_HPP
#define USER_REGISTRY_HPP

// import approf
#include "approf/collaborators.hpp"

#include <cstdint>   // for int32_t
#include <optional>  // for optional
#include <string>    // for string
#include <vector>    // for vector

namespace profilectl {

/// @brief Users of the device.
///
/// Configured users take precedence, then the numeric "<id>.xml" entries of
/// the users directory, then the system user 0.
class SystemUserRegistry final : public approf::UserRegistry {
 public:
    SystemUserRegistry(std::optional<std::vector<std::int32_t>> configured_users, std::string users_dir) noexcept
      : m_configured_users(std::move(configured_users)), m_users_dir(std::move(users_dir)) { }

    [[nodiscard]] auto all_user_ids() const -> std::vector<std::int32_t> override;
    [[nodiscard]] auto acting_user_id() const noexcept -> std::int32_t override;

 private:
    std::optional<std::vector<std::int32_t>> m_configured_users{};
    std::string m_users_dir{};
};

}  // namespace profilectl

#endif  // USER_REGISTRY_HPP

#ifndef CONFIG_HPP
#define CONFIG_HPP

// import approf
#include "approf/operation.hpp"

#include <cstdint>      // for int32_t
#include <expected>     // for expected
#include <map>          // for map
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view
#include <vector>       // for vector

namespace profilectl {

inline constexpr std::string_view DEFAULT_CONFIG_PATH = "/etc/profilectl.toml";

/// Command templates keyed by operation.
using CommandTemplates = std::map<approf::OpCode, std::string>;

/// Front-end configuration.
struct AppConfig {
    // Paths
    std::string profiles_dir{"/data/local/tmp/profilectl/profiles"};
    std::string log_dir{"/data/local/tmp/profilectl/logs"};
    std::string app_log{"/data/local/tmp/profilectl/profilectl.log"};

    // General
    std::string log_level{"info"};
    bool dry_run{false};
    std::optional<std::vector<std::int32_t>> users{};
    std::string users_dir{"/data/system/users"};

    CommandTemplates commands{};
};

/// Returns AppConfig with the default command templates.
[[nodiscard]] auto get_default_config() noexcept -> AppConfig;

/// Parses configuration from TOML content on top of the defaults.
/// @param toml_content The TOML configuration content.
/// @return AppConfig on success, or error string on failure.
[[nodiscard]] auto parse_app_config(std::string_view toml_content) noexcept
    -> std::expected<AppConfig, std::string>;

/// Reads the configuration file, defaults are used when it does not exist.
[[nodiscard]] auto load_app_config(std::string_view filepath) noexcept
    -> std::expected<AppConfig, std::string>;

}  // namespace profilectl

#endif  // CONFIG_HPP

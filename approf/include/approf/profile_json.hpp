#ifndef APPROF_PROFILE_JSON_HPP
#define APPROF_PROFILE_JSON_HPP

#include "approf/profile.hpp"

#include <expected>     // for expected
#include <string>       // for string
#include <string_view>  // for string_view

namespace approf {

/// @brief Parses a profile document.
///
/// Only "name" and "packages" are required. The profile id is taken from
/// the "id" key when present, from fallback_id otherwise.
/// @param json_content The JSON document content.
/// @param fallback_id Identifier used when the document has none.
/// @return The profile on success, or error string on failure.
[[nodiscard]] auto parse_profile(std::string_view json_content, std::string_view fallback_id = {}) noexcept
    -> std::expected<Profile, std::string>;

/// @brief Serializes a profile into a pretty-printed JSON document.
[[nodiscard]] auto serialize_profile(const Profile& profile) noexcept -> std::string;

}  // namespace approf

#endif  // APPROF_PROFILE_JSON_HPP

#ifndef APPROF_STRING_UTILS_HPP
#define APPROF_STRING_UTILS_HPP

#include <cstdint>      // for uint32_t
#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace approf::utils {

namespace sanitize_flags {

// Whitespace characters
inline constexpr std::uint32_t SPACE = 1U << 0;
// '/' and NUL
inline constexpr std::uint32_t UNIX_ILLEGAL_CHARS = 1U << 1;
// "." and ".." names
inline constexpr std::uint32_t UNIX_RESERVED = 1U << 2;
// control characters and "*/:<>?\|
inline constexpr std::uint32_t FAT_ILLEGAL_CHARS = 1U << 3;
// ':'
inline constexpr std::uint32_t MAC_OS_ILLEGAL_CHARS = 1U << 4;

}  // namespace sanitize_flags

/// @brief Remove leading and trailing whitespace.
/// @param str The string to trim.
/// @return A view into str without surrounding whitespace.
constexpr auto trim(std::string_view str) noexcept -> std::string_view {
    constexpr std::string_view WHITESPACE = " \t\n\r\f\v";
    const auto first                      = str.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = str.find_last_not_of(WHITESPACE);
    return str.substr(first, last - first + 1);
}

/// @brief Make a string usable as a file name.
/// @param filename The name to sanitize, surrounding whitespace is dropped.
/// @param replacement Replaces every illegal character.
/// @param flags Combination of sanitize_flags values.
/// @return The sanitized name, std::nullopt when nothing usable remains.
auto sanitize_filename(std::string_view filename, std::string_view replacement, std::uint32_t flags) noexcept -> std::optional<std::string>;

}  // namespace approf::utils

#endif  // APPROF_STRING_UTILS_HPP

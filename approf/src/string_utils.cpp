#include "approf/string_utils.hpp"

#include <cctype>  // for isspace

using namespace std::string_view_literals;

namespace {

constexpr auto FAT_ILLEGAL_CHARS = "\"*/:<>?\\|"sv;

constexpr auto is_control_char(char ch) noexcept -> bool {
    const auto code = static_cast<unsigned char>(ch);
    return code < 0x20 || code == 0x7f;
}

auto is_illegal(char ch, std::uint32_t flags) noexcept -> bool {
    namespace sanitize_flags = approf::utils::sanitize_flags;

    if ((flags & sanitize_flags::SPACE) != 0 && std::isspace(static_cast<unsigned char>(ch)) != 0) {
        return true;
    }
    if ((flags & sanitize_flags::UNIX_ILLEGAL_CHARS) != 0 && (ch == '/' || ch == '\0')) {
        return true;
    }
    if ((flags & sanitize_flags::FAT_ILLEGAL_CHARS) != 0 && (is_control_char(ch) || FAT_ILLEGAL_CHARS.contains(ch))) {
        return true;
    }
    if ((flags & sanitize_flags::MAC_OS_ILLEGAL_CHARS) != 0 && ch == ':') {
        return true;
    }
    return false;
}

}  // namespace

namespace approf::utils {

auto sanitize_filename(std::string_view filename, std::string_view replacement, std::uint32_t flags) noexcept -> std::optional<std::string> {
    filename = trim(filename);
    /* clang-format off */
    if (filename.empty()) { return std::nullopt; }
    /* clang-format on */

    if ((flags & sanitize_flags::UNIX_RESERVED) != 0 && (filename == "."sv || filename == ".."sv)) {
        return std::nullopt;
    }

    std::string result{};
    result.reserve(filename.size());
    for (const char ch : filename) {
        if (is_illegal(ch, flags)) {
            result += replacement;
        } else {
            result += ch;
        }
    }
    return result;
}

}  // namespace approf::utils

#include "approf/file_utils.hpp"

#include <cerrno>   // for errno
#include <cstdio>   // for fopen, fread, fclose
#include <cstring>  // for strerror

#include <fstream>  // for ofstream
#include <memory>   // for unique_ptr

#include <spdlog/spdlog.h>

namespace approf::file_utils {

auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string> {
    // Use std::fopen because it's faster than std::ifstream
    const std::string filepath_str{filepath};
    const std::unique_ptr<std::FILE, decltype(&std::fclose)> file(std::fopen(filepath_str.c_str(), "rb"), std::fclose);
    if (!file) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }

    std::fseek(file.get(), 0, SEEK_END);
    const auto file_size = std::ftell(file.get());
    std::fseek(file.get(), 0, SEEK_SET);
    if (file_size < 0) {
        spdlog::error("[READWHOLEFILE] '{}' is not seekable: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }

    std::string content(static_cast<std::size_t>(file_size), '\0');
    if (std::fread(content.data(), sizeof(char), content.size(), file.get()) != content.size()) {
        spdlog::error("[READWHOLEFILE] '{}' read failed: {}", filepath, std::strerror(errno));
        return std::nullopt;
    }
    return content;
}

auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool {
    std::ofstream file{std::string{filepath}, std::ios::out | std::ios::trunc};
    if (!file.is_open()) {
        spdlog::error("[WRITE_TO_FILE] '{}' open failed: {}", filepath, std::strerror(errno));
        return false;
    }
    file << data;
    if (!file) {
        spdlog::error("[WRITE_TO_FILE] '{}' write failed", filepath);
        return false;
    }
    return true;
}

}  // namespace approf::file_utils

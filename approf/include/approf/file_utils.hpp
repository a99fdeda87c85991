#ifndef APPROF_FILE_UTILS_HPP
#define APPROF_FILE_UTILS_HPP

#include <optional>     // for optional
#include <string>       // for string
#include <string_view>  // for string_view

namespace approf::file_utils {

// Returns std::nullopt when the file cannot be read.
auto read_whole_file(std::string_view filepath) noexcept -> std::optional<std::string>;

// If the file doesn't exist, then it create one and write into it.
// If the file exists already, then it will overwrite file content with provided data.
auto create_file_for_overwrite(std::string_view filepath, std::string_view data) noexcept -> bool;

}  // namespace approf::file_utils

#endif  // APPROF_FILE_UTILS_HPP

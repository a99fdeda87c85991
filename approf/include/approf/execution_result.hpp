#ifndef APPROF_EXECUTION_RESULT_HPP
#define APPROF_EXECUTION_RESULT_HPP

#include <cstdint>  // for int32_t
#include <string>   // for string
#include <vector>   // for vector

#include <fmt/format.h>
#include <fmt/ranges.h>

namespace approf {

/// @brief Target pair an operation failed on.
struct FailedTarget final {
    std::string package_name{};
    std::int32_t user{};

    auto operator==(const FailedTarget&) const -> bool = default;
};

/// @brief Outcome of one batched operation.
struct ExecutionResult final {
    bool success{true};
    std::vector<FailedTarget> failed{};
    bool requires_restart{false};

    [[nodiscard]] auto is_successful() const noexcept -> bool { return success && failed.empty(); }

    auto operator==(const ExecutionResult&) const -> bool = default;
};

}  // namespace approf

template <>
struct fmt::formatter<approf::FailedTarget> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const approf::FailedTarget& target, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "{}:{}", target.package_name, target.user);
    }
};

template <>
struct fmt::formatter<approf::ExecutionResult> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(const approf::ExecutionResult& result, FormatContext& ctx) const -> decltype(ctx.out()) {
        return fmt::format_to(ctx.out(), "(success:'{}', failed:{}, requires_restart:'{}')",
            result.success, result.failed, result.requires_restart);
    }
};

#endif  // APPROF_EXECUTION_RESULT_HPP

#ifndef APPROF_PROFILE_LOGGER_HPP
#define APPROF_PROFILE_LOGGER_HPP

#include <expected>     // for expected
#include <memory>       // for shared_ptr, unique_ptr
#include <string>       // for string
#include <string_view>  // for string_view

namespace spdlog {
class logger;
}  // namespace spdlog

namespace approf {

/// @brief Append-only execution log of a profile run.
class ProfileLogger {
 public:
    virtual ~ProfileLogger() = default;

    virtual void println(std::string_view message) noexcept = 0;
    virtual void println(std::string_view message, std::string_view cause) noexcept = 0;

    // Flush and release the underlying log. Further lines are dropped.
    virtual void close() noexcept = 0;
};

/// @brief Logger used when the execution log is unavailable.
class NullProfileLogger final : public ProfileLogger {
 public:
    void println(std::string_view) noexcept override { }
    void println(std::string_view, std::string_view) noexcept override { }
    void close() noexcept override { }
};

/// @brief Writes timestamped lines into "<log_dir>/<profile_id>.log".
class FileProfileLogger final : public ProfileLogger {
 public:
    explicit FileProfileLogger(std::shared_ptr<spdlog::logger> logger) noexcept;
    ~FileProfileLogger() override;

    FileProfileLogger(const FileProfileLogger&)     = delete;
    auto operator=(const FileProfileLogger&) = delete;

    /// @brief Opens the log of a profile for appending.
    /// @param log_dir Directory of execution logs, created when missing.
    /// @param profile_id The profile identifier.
    /// @return The logger, or the reason the log could not be opened.
    static auto open(std::string_view log_dir, std::string_view profile_id) noexcept
        -> std::expected<std::unique_ptr<FileProfileLogger>, std::string>;

    static auto log_path(std::string_view log_dir, std::string_view profile_id) noexcept -> std::string;

    void println(std::string_view message) noexcept override;
    void println(std::string_view message, std::string_view cause) noexcept override;
    void close() noexcept override;

 private:
    std::shared_ptr<spdlog::logger> m_logger;
};

}  // namespace approf

#endif  // APPROF_PROFILE_LOGGER_HPP

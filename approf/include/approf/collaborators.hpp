#ifndef APPROF_COLLABORATORS_HPP
#define APPROF_COLLABORATORS_HPP

#include "approf/execution_result.hpp"
#include "approf/operation.hpp"
#include "approf/targets.hpp"

#include <cstdint>  // for int32_t
#include <vector>   // for vector

namespace approf {

/// @brief Performs one batched operation over a set of targets.
///
/// Implementations may parallelize over targets internally, a call is
/// blocking from the caller's point of view.
class BatchExecutor {
 public:
    virtual ~BatchExecutor() = default;

    virtual auto execute(OpCode op, const Targets& targets, const OperationOptions& options) -> ExecutionResult = 0;

    // Release resources held across operations.
    virtual void release() noexcept { }
};

class ProgressSink {
 public:
    virtual ~ProgressSink() = default;

    virtual void set_total(std::int32_t total, std::int32_t current) noexcept = 0;
};

/// @brief Users known to the system.
class UserRegistry {
 public:
    virtual ~UserRegistry() = default;

    [[nodiscard]] virtual auto all_user_ids() const -> std::vector<std::int32_t> = 0;

    /// @return The user the engine is running as.
    [[nodiscard]] virtual auto acting_user_id() const noexcept -> std::int32_t = 0;
};

}  // namespace approf

#endif  // APPROF_COLLABORATORS_HPP

#ifndef APPROF_PROGRESS_HPP
#define APPROF_PROGRESS_HPP

#include "approf/profile.hpp"

#include <cstddef>  // for size_t
#include <cstdint>  // for int32_t

namespace approf {

/// @brief Number of features the profile enables.
///
/// Collections count once whatever their size. Export rules never count.
auto count_enabled_features(const Profile& profile) noexcept -> std::int32_t;

/// @brief Units of work of a run, known before any operation executes.
/// @param profile The profile to run.
/// @param target_count Number of (package, user) pairs.
/// @return count_enabled_features(profile) * target_count.
auto estimate_progress(const Profile& profile, std::size_t target_count) noexcept -> std::int32_t;

}  // namespace approf

#endif  // APPROF_PROGRESS_HPP

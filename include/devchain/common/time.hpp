#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace devchain::common {

using Clock = std::chrono::system_clock;
using Timestamp = Clock::time_point;

[[nodiscard]] std::string format_rfc3339(Timestamp timestamp);
[[nodiscard]] std::optional<Timestamp> parse_rfc3339(const std::string &value);

/// Whole days elapsed between `then` and `now`, floored, never negative.
[[nodiscard]] std::int64_t age_in_days(Timestamp then, Timestamp now = Clock::now());

} // namespace devchain::common

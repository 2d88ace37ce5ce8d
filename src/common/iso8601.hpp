#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace iso8601 {

using TimePoint = std::chrono::system_clock::time_point;

// UTC with millisecond precision: 2024-05-01T09:30:00.250Z
std::string format(TimePoint tp);

// Accepts an optional fraction and a Z or +HH:MM / -HH:MM suffix. A missing
// zone is read as UTC. Returns nullopt for anything that is not a valid
// calendar date-time.
std::optional<TimePoint> parse(std::string_view s);

} // namespace iso8601

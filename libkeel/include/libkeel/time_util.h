//
// Created by cv2 on 10/2/25.
//

#pragma once

#include <chrono>
#include <optional>
#include <string>

namespace keel {

    using Clock = std::chrono::system_clock;
    using TimePoint = Clock::time_point;

    // Current time truncated to microseconds. Everything we persist goes through
    // this, so a value written to disk reads back identical.
    TimePoint timestamp_now();

    // "2025-10-02T14:03:11.123456Z" (always UTC, fixed width).
    std::string to_iso8601(TimePoint tp);
    std::optional<TimePoint> from_iso8601(const std::string& text);

    double seconds_between(TimePoint start, TimePoint end);

} // namespace keel

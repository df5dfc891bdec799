//
// Created by cv2 on 10/2/25.
//

#include "libkeel/time_util.h"

#include <cctype>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace keel {

    TimePoint timestamp_now() {
        return std::chrono::time_point_cast<Clock::duration>(
                std::chrono::floor<std::chrono::microseconds>(Clock::now()));
    }

    std::string to_iso8601(TimePoint tp) {
        const auto secs = std::chrono::floor<std::chrono::seconds>(tp);
        const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(tp - secs).count();
        const std::time_t t = Clock::to_time_t(secs);

        std::tm tm{};
        gmtime_r(&t, &tm);

        std::stringstream ss;
        ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S")
           << '.' << std::setw(6) << std::setfill('0') << micros << 'Z';
        return ss.str();
    }

    std::optional<TimePoint> from_iso8601(const std::string& text) {
        std::tm tm{};
        std::istringstream ss(text);
        ss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
        if (ss.fail()) {
            return std::nullopt;
        }

        // Optional fractional part, normalised to exactly six digits.
        long long micros = 0;
        if (ss.peek() == '.') {
            ss.get();
            std::string digits;
            while (std::isdigit(ss.peek())) {
                digits += static_cast<char>(ss.get());
            }
            digits.resize(6, '0');
            micros = std::stoll(digits);
        }

        const std::time_t t = timegm(&tm);
        if (t == static_cast<std::time_t>(-1)) {
            return std::nullopt;
        }
        return Clock::from_time_t(t) + std::chrono::microseconds(micros);
    }

    double seconds_between(TimePoint start, TimePoint end) {
        return std::chrono::duration<double>(end - start).count();
    }

} // namespace keel

#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <string>

namespace scout {

/**
 * Timestamp - a point in wall-clock time, in milliseconds since the Unix epoch.
 *
 * Stamped on every accepted response; records compare by it to decide which
 * merge was the later one.
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::system_clock;
    using TimePoint = std::chrono::time_point<Clock, Duration>;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    explicit Timestamp(TimePoint tp) noexcept
        : millis_(std::chrono::duration_cast<Duration>(tp.time_since_epoch()).count()) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::time_point_cast<Duration>(Clock::now()));
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    /**
     * Format as ISO 8601 string, e.g. 2024-05-01T12:00:00.250Z.
     */
    [[nodiscard]] std::string to_iso_string() const {
        const auto tp = TimePoint(Duration(millis_));
        const auto time_t = Clock::to_time_t(tp);
        std::tm utc{};
        gmtime_r(&time_t, &utc);

        std::ostringstream oss;
        oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S");
        oss << '.' << std::setfill('0') << std::setw(3) << (millis_ % 1000) << 'Z';
        return oss.str();
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

private:
    int64_t millis_;
};

} // namespace scout

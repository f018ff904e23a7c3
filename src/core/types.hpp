#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <functional>

namespace lanmail {

/**
 * Timestamp - a point on the monotonic clock, in milliseconds.
 *
 * Used for liveness bookkeeping only. Wall-clock times that travel over the
 * wire (Mail::timestamp) are plain unix seconds, see unix_time_seconds().
 */
class Timestamp {
public:
    using Duration = std::chrono::milliseconds;
    using Clock = std::chrono::steady_clock;

    constexpr Timestamp() noexcept : millis_(0) {}

    explicit constexpr Timestamp(int64_t millis) noexcept : millis_(millis) {}

    [[nodiscard]] static Timestamp now() {
        return Timestamp(std::chrono::duration_cast<Duration>(
            Clock::now().time_since_epoch()).count());
    }

    [[nodiscard]] constexpr int64_t millis() const noexcept {
        return millis_;
    }

    auto operator<=>(const Timestamp&) const = default;
    bool operator==(const Timestamp&) const = default;

    Timestamp operator+(Duration d) const {
        return Timestamp(millis_ + d.count());
    }

    Timestamp operator-(Duration d) const {
        return Timestamp(millis_ - d.count());
    }

    Duration operator-(const Timestamp& other) const {
        return Duration(millis_ - other.millis_);
    }

private:
    int64_t millis_;
};

/**
 * Source of "now" for components that need deterministic time in tests.
 */
using ClockFn = std::function<Timestamp()>;

[[nodiscard]] inline int64_t unix_time_seconds() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace lanmail

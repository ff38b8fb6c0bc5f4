/**
 * @file timestamp.hpp
 * @brief RFC3339 timestamps and the commit clock
 */

#ifndef CLOUDDOC_COMMON_TIMESTAMP_HPP
#define CLOUDDOC_COMMON_TIMESTAMP_HPP

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace clouddoc::common {

/**
 * @brief Point in time as seconds since the Unix epoch plus nanoseconds
 */
struct Timestamp {
    static constexpr int32_t NANOS_PER_SECOND = 1000000000;
    static constexpr int32_t NANOS_PER_MILLI = 1000000;
    static constexpr int32_t NANOS_PER_MICRO = 1000;

    /* 0001-01-01T00:00:00Z through 9999-12-31T23:59:59Z */
    static constexpr int64_t MIN_SECONDS = -62135596800;
    static constexpr int64_t MAX_SECONDS = 253402300799;

    int64_t seconds = 0;
    int32_t nanos = 0;  // always in [0, NANOS_PER_SECOND)

    /**
     * @brief Parse "YYYY-MM-DDTHH:MM:SS[.f{1,9}](Z|+HH:MM|-HH:MM)"
     * @return std::nullopt if the text is not a valid RFC3339 timestamp
     */
    [[nodiscard]] static std::optional<Timestamp> parse(const std::string& text);

    /**
     * @brief Build a timestamp from seconds/nanos, normalising nanos into range
     */
    [[nodiscard]] static Timestamp from_parts(int64_t seconds, int64_t nanos);

    /**
     * @brief Current wall-clock time
     */
    [[nodiscard]] static Timestamp now();

    /**
     * @brief UTC RFC3339 text with 3, 6 or 9 fractional digits
     */
    [[nodiscard]] std::string to_string() const;

    /**
     * @brief Milliseconds since the epoch, sub-millisecond part truncated
     */
    [[nodiscard]] int64_t to_millis() const;

    [[nodiscard]] bool operator==(const Timestamp& other) const {
        return seconds == other.seconds && nanos == other.nanos;
    }
    [[nodiscard]] bool operator!=(const Timestamp& other) const { return !(*this == other); }
    [[nodiscard]] bool operator<(const Timestamp& other) const {
        return seconds < other.seconds || (seconds == other.seconds && nanos < other.nanos);
    }
    [[nodiscard]] bool operator<=(const Timestamp& other) const { return !(other < *this); }
};

/**
 * @brief Hands out strictly increasing commit timestamps at microsecond
 * resolution, so updateTime never repeats or moves backwards.
 */
class CommitClock {
   public:
    CommitClock() = default;

    CommitClock(const CommitClock&) = delete;
    CommitClock& operator=(const CommitClock&) = delete;
    CommitClock(CommitClock&&) = delete;
    CommitClock& operator=(CommitClock&&) = delete;

    [[nodiscard]] Timestamp next();

   private:
    std::mutex latch_;
    Timestamp last_;
};

}  // namespace clouddoc::common

#endif  // CLOUDDOC_COMMON_TIMESTAMP_HPP

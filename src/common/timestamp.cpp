/**
 * @file timestamp.cpp
 * @brief RFC3339 parsing/formatting and commit clock
 *
 * @defgroup timestamp Timestamps
 * @{
 */

#include "common/timestamp.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <mutex>
#include <optional>
#include <string>

namespace clouddoc::common {

namespace {

constexpr int64_t SECONDS_PER_DAY = 86400;
constexpr int64_t SECONDS_PER_HOUR = 3600;
constexpr int64_t SECONDS_PER_MINUTE = 60;
constexpr size_t DATE_TIME_LEN = 19;  // YYYY-MM-DDTHH:MM:SS
constexpr size_t MAX_FRACTION_DIGITS = 9;
constexpr int MAX_YEAR = 9999;

/* Days since 1970-01-01 for a proleptic Gregorian date */
int64_t days_from_civil(int64_t y, int64_t m, int64_t d) {
    y -= (m <= 2) ? 1 : 0;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const int64_t yoe = y - era * 400;
    const int64_t doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const int64_t doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

void civil_from_days(int64_t z, int64_t& y, int64_t& m, int64_t& d) {
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const int64_t doe = z - era * 146097;
    const int64_t yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const int64_t mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp + (mp < 10 ? 3 : -9);
    y = yoe + era * 400 + ((m <= 2) ? 1 : 0);
}

bool is_leap_year(int64_t y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

int64_t days_in_month(int64_t y, int64_t m) {
    static constexpr std::array<int64_t, 12> DAYS = {31, 28, 31, 30, 31, 30,
                                                     31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) {
        return 29;
    }
    return DAYS[static_cast<size_t>(m - 1)];
}

/* Reads exactly `count` digits at `pos`; false if any is not a digit */
bool read_digits(const std::string& s, size_t pos, size_t count, int64_t& out) {
    if (pos + count > s.size()) {
        return false;
    }
    out = 0;
    for (size_t i = pos; i < pos + count; ++i) {
        const auto c = static_cast<unsigned char>(s[i]);
        if (std::isdigit(c) == 0) {
            return false;
        }
        out = out * 10 + (s[i] - '0');
    }
    return true;
}

}  // anonymous namespace

std::optional<Timestamp> Timestamp::parse(const std::string& text) {
    if (text.size() < DATE_TIME_LEN + 1) {
        return std::nullopt;
    }

    int64_t year = 0;
    int64_t month = 0;
    int64_t day = 0;
    int64_t hour = 0;
    int64_t minute = 0;
    int64_t second = 0;

    if (!read_digits(text, 0, 4, year) || text[4] != '-' || !read_digits(text, 5, 2, month) ||
        text[7] != '-' || !read_digits(text, 8, 2, day) ||
        (text[10] != 'T' && text[10] != 't' && text[10] != ' ') ||
        !read_digits(text, 11, 2, hour) || text[13] != ':' || !read_digits(text, 14, 2, minute) ||
        text[16] != ':' || !read_digits(text, 17, 2, second)) {
        return std::nullopt;
    }

    if (month < 1 || month > 12 || day < 1 || day > days_in_month(year, month) || hour > 23 ||
        minute > 59 || second > 59) {
        return std::nullopt;
    }

    size_t pos = DATE_TIME_LEN;
    int64_t nanos = 0;
    if (text[pos] == '.') {
        ++pos;
        size_t digits = 0;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos])) != 0) {
            if (digits < MAX_FRACTION_DIGITS) {
                nanos = nanos * 10 + (text[pos] - '0');
            }
            ++digits;
            ++pos;
        }
        if (digits == 0 || digits > MAX_FRACTION_DIGITS) {
            return std::nullopt;
        }
        for (size_t i = digits; i < MAX_FRACTION_DIGITS; ++i) {
            nanos *= 10;
        }
    }

    if (pos >= text.size()) {
        return std::nullopt;
    }

    int64_t offset_seconds = 0;
    const char zone = text[pos];
    if (zone == 'Z' || zone == 'z') {
        ++pos;
    } else if (zone == '+' || zone == '-') {
        int64_t off_hour = 0;
        int64_t off_minute = 0;
        if (!read_digits(text, pos + 1, 2, off_hour) || pos + 3 >= text.size() ||
            text[pos + 3] != ':' || !read_digits(text, pos + 4, 2, off_minute) || off_hour > 23 ||
            off_minute > 59) {
            return std::nullopt;
        }
        offset_seconds = off_hour * SECONDS_PER_HOUR + off_minute * SECONDS_PER_MINUTE;
        if (zone == '-') {
            offset_seconds = -offset_seconds;
        }
        pos += 6;
    } else {
        return std::nullopt;
    }

    if (pos != text.size()) {
        return std::nullopt;
    }

    const int64_t days = days_from_civil(year, month, day);
    const int64_t secs = days * SECONDS_PER_DAY + hour * SECONDS_PER_HOUR +
                         minute * SECONDS_PER_MINUTE + second - offset_seconds;
    return from_parts(secs, nanos);
}

Timestamp Timestamp::from_parts(int64_t seconds, int64_t nanos) {
    seconds += nanos / NANOS_PER_SECOND;
    nanos %= NANOS_PER_SECOND;
    if (nanos < 0) {
        nanos += NANOS_PER_SECOND;
        seconds -= 1;
    }
    Timestamp ts;
    ts.seconds = seconds;
    ts.nanos = static_cast<int32_t>(nanos);
    return ts;
}

Timestamp Timestamp::now() {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    const auto total_nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch).count();
    return from_parts(0, static_cast<int64_t>(total_nanos));
}

std::string Timestamp::to_string() const {
    int64_t days = seconds / SECONDS_PER_DAY;
    int64_t rem = seconds % SECONDS_PER_DAY;
    if (rem < 0) {
        rem += SECONDS_PER_DAY;
        days -= 1;
    }

    int64_t year = 0;
    int64_t month = 0;
    int64_t day = 0;
    civil_from_days(days, year, month, day);
    if (year < 0) {
        year = 0;
    } else if (year > MAX_YEAR) {
        year = MAX_YEAR;
    }

    static constexpr int BUF_SIZE = 48;
    std::array<char, BUF_SIZE> buf{};
    const int hour = static_cast<int>(rem / SECONDS_PER_HOUR);
    const int minute = static_cast<int>((rem % SECONDS_PER_HOUR) / SECONDS_PER_MINUTE);
    const int second = static_cast<int>(rem % SECONDS_PER_MINUTE);

    int len = std::snprintf(buf.data(), buf.size(), "%04d-%02d-%02dT%02d:%02d:%02d",
                            static_cast<int>(year), static_cast<int>(month),
                            static_cast<int>(day), hour, minute, second);
    if (len < 0) {
        return "";
    }

    const auto offset = static_cast<size_t>(len);
    if (nanos % NANOS_PER_MILLI == 0) {
        len = std::snprintf(buf.data() + offset, buf.size() - offset, ".%03dZ",
                            nanos / NANOS_PER_MILLI);
    } else if (nanos % NANOS_PER_MICRO == 0) {
        len = std::snprintf(buf.data() + offset, buf.size() - offset, ".%06dZ",
                            nanos / NANOS_PER_MICRO);
    } else {
        len = std::snprintf(buf.data() + offset, buf.size() - offset, ".%09dZ", nanos);
    }
    if (len < 0) {
        return "";
    }
    return buf.data();
}

int64_t Timestamp::to_millis() const {
    return seconds * 1000 + nanos / NANOS_PER_MILLI;
}

Timestamp CommitClock::next() {
    const std::scoped_lock<std::mutex> lock(latch_);
    Timestamp candidate = Timestamp::now();
    candidate.nanos -= candidate.nanos % Timestamp::NANOS_PER_MICRO;
    if (candidate <= last_) {
        candidate = Timestamp::from_parts(last_.seconds,
                                          static_cast<int64_t>(last_.nanos) +
                                              Timestamp::NANOS_PER_MICRO);
    }
    last_ = candidate;
    return candidate;
}

}  // namespace clouddoc::common

/** @} */ /* timestamp */

/**
 * @file Clock.hpp
 * @brief Injectable time source and calendar date helper
 */

#pragma once

#include <chrono>
#include <string>

namespace OptionsScalper {

/**
 * @struct Date
 * @brief Calendar date in the exchange's local time zone
 */
struct Date {
    int year = 0;   ///< Four-digit year
    int month = 0;  ///< 1..12
    int day = 0;    ///< 1..31

    /**
     * @brief Format as YYYY-MM-DD
     */
    std::string toString() const;

    /**
     * @brief Whether the fields form a real calendar date
     */
    bool isValid() const;

    /**
     * @brief Number of days in a month
     * @param year Four-digit year
     * @param month 1..12
     * @return Days in that month, 0 for an invalid month
     */
    static int daysInMonth(int year, int month);

    /**
     * @brief Local calendar date of a time point
     */
    static Date fromTimePoint(std::chrono::system_clock::time_point timePoint);

    bool operator==(const Date& other) const {
        return year == other.year && month == other.month && day == other.day;
    }

    bool operator!=(const Date& other) const { return !(*this == other); }

    bool operator<(const Date& other) const {
        if (year != other.year) return year < other.year;
        if (month != other.month) return month < other.month;
        return day < other.day;
    }
};

/**
 * @class Clock
 * @brief Source of "now" for timers, timestamps and expiry checks
 *
 * Components hold a shared_ptr<Clock>; tests substitute a manual clock to
 * drive heartbeat, cooldown and reconnect timers deterministically.
 */
class Clock {
public:
    using TimePoint = std::chrono::system_clock::time_point;

    virtual ~Clock() = default;

    /**
     * @brief Current wall-clock time
     */
    virtual TimePoint now() const = 0;

    /**
     * @brief Current local calendar date
     */
    virtual Date today() const { return Date::fromTimePoint(now()); }
};

/**
 * @class SystemClock
 * @brief Clock backed by std::chrono::system_clock
 */
class SystemClock : public Clock {
public:
    TimePoint now() const override { return std::chrono::system_clock::now(); }
};

/**
 * @brief Format a time point as "YYYY-MM-DD HH:MM:SS" in local time
 */
std::string formatDateTime(std::chrono::system_clock::time_point timePoint);

/**
 * @brief Parse "YYYY-MM-DD HH:MM:SS" as local time
 * @return Parsed time point, or the epoch when the text does not match
 */
std::chrono::system_clock::time_point parseDateTime(const std::string& text);

}  // namespace OptionsScalper

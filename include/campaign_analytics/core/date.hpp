// include/campaign_analytics/core/date.hpp
#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include "campaign_analytics/core/error.hpp"

namespace campaign_analytics {

/**
 * @brief Calendar date in the proleptic Gregorian calendar
 *
 * Tracking and post rows are dated to the day; all date arithmetic in the
 * engine goes through day numbers (days since 1970-01-01).
 */
struct Date {
    int year{1970};
    int month{1};
    int day{1};

    Date() = default;
    Date(int y, int m, int d) : year(y), month(m), day(d) {}

    /**
     * @brief Parse "YYYY-MM-DD"; a trailing time part ("T..." or " ...") is ignored
     */
    static Result<Date> parse(const std::string& text);

    static Date from_days(int64_t days_since_epoch);

    /**
     * @brief Today's date in local time
     */
    static Date today();

    int64_t to_days() const;

    Date add_days(int64_t days) const {
        return from_days(to_days() + days);
    }

    std::string to_string() const;

    bool is_valid() const;
};

inline bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}
inline bool operator!=(const Date& a, const Date& b) {
    return !(a == b);
}
inline bool operator<(const Date& a, const Date& b) {
    if (a.year != b.year)
        return a.year < b.year;
    if (a.month != b.month)
        return a.month < b.month;
    return a.day < b.day;
}
inline bool operator>(const Date& a, const Date& b) {
    return b < a;
}
inline bool operator<=(const Date& a, const Date& b) {
    return !(b < a);
}
inline bool operator>=(const Date& a, const Date& b) {
    return !(a < b);
}

/**
 * @brief ISO-8601 week, keyed by ISO week-numbering year
 */
struct IsoWeek {
    int year{0};
    int week{0};

    static IsoWeek of(const Date& date);

    std::string to_string() const;  // "2024-W05"
};

inline bool operator==(const IsoWeek& a, const IsoWeek& b) {
    return a.year == b.year && a.week == b.week;
}
inline bool operator<(const IsoWeek& a, const IsoWeek& b) {
    return a.year != b.year ? a.year < b.year : a.week < b.week;
}

/**
 * @brief Inclusive [start, end] date window
 */
struct DateRange {
    Date start;
    Date end;

    bool contains(const Date& date) const {
        return date >= start && date <= end;
    }
};

}  // namespace campaign_analytics

namespace std {
template <>
struct hash<campaign_analytics::Date> {
    size_t operator()(const campaign_analytics::Date& d) const noexcept {
        return std::hash<int64_t>()(d.to_days());
    }
};
}  // namespace std

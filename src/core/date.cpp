// src/core/date.cpp

#include "campaign_analytics/core/date.hpp"
#include <cctype>
#include <chrono>
#include <cstdio>
#include "campaign_analytics/core/time_utils.hpp"

namespace campaign_analytics {

namespace {

// Days since 1970-01-01 for a civil date (H. Hinnant's days_from_civil)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m > 2 ? m - 3 : m + 9) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

int days_in_month(int year, int month) {
    static const int kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool read_number(const std::string& text, size_t pos, size_t len, int& out) {
    if (text.size() < pos + len) {
        return false;
    }
    int value = 0;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!std::isdigit(static_cast<unsigned char>(text[i]))) {
            return false;
        }
        value = value * 10 + (text[i] - '0');
    }
    out = value;
    return true;
}

}  // namespace

Result<Date> Date::parse(const std::string& text) {
    Date date;
    bool shape_ok = read_number(text, 0, 4, date.year) && text.size() >= 10 && text[4] == '-' &&
                    read_number(text, 5, 2, date.month) && text[7] == '-' &&
                    read_number(text, 8, 2, date.day);

    if (shape_ok && text.size() > 10 && text[10] != 'T' && text[10] != ' ') {
        shape_ok = false;
    }

    if (!shape_ok || !date.is_valid()) {
        return make_error<Date>(ErrorCode::CONVERSION_ERROR,
                                "Invalid date '" + text + "', expected YYYY-MM-DD", "Date");
    }
    return date;
}

Date Date::from_days(int64_t days_since_epoch) {
    // H. Hinnant's civil_from_days
    int64_t z = days_since_epoch + 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const int64_t y = static_cast<int64_t>(yoe) + era * 400;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    const unsigned d = doy - (153 * mp + 2) / 5 + 1;
    const unsigned m = mp < 10 ? mp + 3 : mp - 9;
    return Date(static_cast<int>(y + (m <= 2)), static_cast<int>(m), static_cast<int>(d));
}

Date Date::today() {
    auto now_c = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    if (core::safe_localtime(&now_c, &local) == nullptr) {
        return from_days(static_cast<int64_t>(now_c) / 86400);
    }
    return Date(local.tm_year + 1900, local.tm_mon + 1, local.tm_mday);
}

int64_t Date::to_days() const {
    return days_from_civil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
}

std::string Date::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return std::string(buffer);
}

bool Date::is_valid() const {
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }
    return day <= days_in_month(year, month);
}

IsoWeek IsoWeek::of(const Date& date) {
    const int64_t days = date.to_days();
    // 1970-01-01 was a Thursday; ISO weekday runs Monday=1 .. Sunday=7
    const int64_t iso_weekday = ((days % 7) + 7 + 3) % 7 + 1;
    const int64_t thursday = days - iso_weekday + 4;

    IsoWeek result;
    result.year = Date::from_days(thursday).year;
    const int64_t jan_first = Date(result.year, 1, 1).to_days();
    result.week = static_cast<int>((thursday - jan_first) / 7 + 1);
    return result;
}

std::string IsoWeek::to_string() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-W%02d", year, week);
    return std::string(buffer);
}

}  // namespace campaign_analytics

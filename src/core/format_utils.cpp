// src/core/format_utils.cpp

#include "campaign_analytics/core/format_utils.hpp"
#include <cmath>
#include <cstdio>

namespace campaign_analytics {
namespace core {

namespace {
const char* const kRupee = "\xE2\x82\xB9";  // U+20B9

std::string with_one_decimal(double value, const char* suffix) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.1f%s", value, suffix);
    return buffer;
}
}  // namespace

std::string format_currency(double amount) {
    if (amount >= 10000000.0) {
        return kRupee + with_one_decimal(amount / 10000000.0, "Cr");
    }
    if (amount >= 100000.0) {
        return kRupee + with_one_decimal(amount / 100000.0, "L");
    }
    if (amount >= 1000.0) {
        return kRupee + with_one_decimal(amount / 1000.0, "K");
    }
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.0f", amount);
    return kRupee + std::string(buffer);
}

std::string format_currency_grouped(double amount) {
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.0f", std::fabs(amount));
    std::string digits(buffer);

    std::string grouped;
    int count = 0;
    for (auto it = digits.rbegin(); it != digits.rend(); ++it) {
        if (count > 0 && count % 3 == 0) {
            grouped.insert(grouped.begin(), ',');
        }
        grouped.insert(grouped.begin(), *it);
        ++count;
    }

    return (amount < 0 && digits != "0" ? "-" : "") + std::string(kRupee) + grouped;
}

std::string format_number(double number) {
    if (number >= 1000000.0) {
        return with_one_decimal(number / 1000000.0, "M");
    }
    if (number >= 1000.0) {
        return with_one_decimal(number / 1000.0, "K");
    }
    return std::to_string(static_cast<long long>(number));
}

double calculate_growth_rate(double current_value, double previous_value) {
    if (previous_value == 0.0) {
        return current_value > 0.0 ? 100.0 : 0.0;
    }
    return ((current_value - previous_value) / previous_value) * 100.0;
}

Result<void> validate_date_range(const Date& start, const Date& end, const Date& today) {
    if (start > end) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Start date cannot be after end date", "DateRange");
    }
    if (end.to_days() - start.to_days() > 365) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "Date range cannot exceed 365 days", "DateRange");
    }
    if (end > today) {
        return make_error<void>(ErrorCode::INVALID_ARGUMENT,
                                "End date cannot be in the future", "DateRange");
    }
    return Result<void>();
}

}  // namespace core
}  // namespace campaign_analytics

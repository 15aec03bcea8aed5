// include/campaign_analytics/core/format_utils.hpp
#pragma once

#include <string>
#include "campaign_analytics/core/date.hpp"
#include "campaign_analytics/core/error.hpp"

namespace campaign_analytics {
namespace core {

/**
 * @brief Compact rupee amount: Cr at 1e7, L at 1e5, K at 1e3, whole rupees below
 *
 * Examples: 25000000 -> "₹2.5Cr", 150000 -> "₹1.5L", 4200 -> "₹4.2K", 950 -> "₹950"
 */
std::string format_currency(double amount);

/**
 * @brief Whole rupees with thousands separators, e.g. 1234567.4 -> "₹1,234,567"
 */
std::string format_currency_grouped(double amount);

/**
 * @brief Compact count: M at 1e6, K at 1e3, truncated integer below
 */
std::string format_number(double number);

/**
 * @brief Percentage change from previous to current
 *
 * A zero previous value reports 100 when current is positive and 0 otherwise.
 */
double calculate_growth_rate(double current_value, double previous_value);

/**
 * @brief Check a user-selected reporting window
 * @param today Reference date for the "not in the future" rule
 * @return INVALID_ARGUMENT naming the violated rule
 */
Result<void> validate_date_range(const Date& start, const Date& end, const Date& today);

}  // namespace core
}  // namespace campaign_analytics

/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
 */

#ifndef SIM_TIME_HPP
#define SIM_TIME_HPP

/**
 * @file SimTime.hpp
 * @brief Simulation timestamps and calendar helpers
 *
 * Simulation time is wall-clock style (a calendar date plus time of day)
 * with one-second resolution. Agents only care about two things:
 * - whether two timestamps fall on the same calendar day
 * - a stable text form for snapshots ("February 13, 2023, 14:05:00")
 */

#include <chrono>
#include <optional>
#include <string>

namespace Smallville {

using SimTime = std::chrono::sys_seconds;

/**
 * @brief Build a timestamp from calendar fields (UTC, no leap seconds)
 */
SimTime makeSimTime(int year, unsigned month, unsigned day,
                    int hour = 0, int minute = 0, int second = 0);

/**
 * @brief Calendar day containing the timestamp
 */
inline std::chrono::year_month_day calendarDay(SimTime time) {
    return std::chrono::year_month_day{std::chrono::floor<std::chrono::days>(time)};
}

inline bool isSameCalendarDay(SimTime a, SimTime b) {
    return calendarDay(a) == calendarDay(b);
}

/**
 * @brief Format as "February 13, 2023, 14:05:00"
 */
std::string formatSimTime(SimTime time);

/**
 * @brief Parse the formatSimTime() text form
 * @return Timestamp, or std::nullopt if the text is malformed
 */
std::optional<SimTime> parseSimTime(const std::string& text);

} // namespace Smallville

#endif // SIM_TIME_HPP

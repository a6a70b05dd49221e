/* Copyright (c) 2025 Hammer Forged Games
 * All rights reserved.
 * Licensed under the MIT License - see LICENSE file for details
*/

#include "core/SimTime.hpp"
#include <array>
#include <cstdio>
#include <format>
#include <string_view>

namespace Smallville {

namespace {

constexpr std::array<std::string_view, 12> MONTH_NAMES = {
    "January", "February", "March",     "April",   "May",      "June",
    "July",    "August",   "September", "October", "November", "December"};

} // anonymous namespace

SimTime makeSimTime(int year, unsigned month, unsigned day,
                    int hour, int minute, int second) {
    using namespace std::chrono;
    sys_days date = year_month_day{std::chrono::year{year}, std::chrono::month{month},
                                   std::chrono::day{day}};
    return SimTime{date} + hours{hour} + minutes{minute} + seconds{second};
}

std::string formatSimTime(SimTime time) {
    using namespace std::chrono;
    const sys_days date = floor<days>(time);
    const year_month_day ymd{date};
    const hh_mm_ss<seconds> tod{time - date};

    return std::format("{} {:02}, {}, {:02}:{:02}:{:02}",
                       MONTH_NAMES[static_cast<unsigned>(ymd.month()) - 1],
                       static_cast<unsigned>(ymd.day()),
                       static_cast<int>(ymd.year()), tod.hours().count(),
                       tod.minutes().count(), tod.seconds().count());
}

std::optional<SimTime> parseSimTime(const std::string& text) {
    const size_t space = text.find(' ');
    if (space == std::string::npos) {
        return std::nullopt;
    }

    const std::string_view monthName(text.data(), space);
    unsigned month = 0;
    for (size_t i = 0; i < MONTH_NAMES.size(); ++i) {
        if (MONTH_NAMES[i] == monthName) {
            month = static_cast<unsigned>(i + 1);
            break;
        }
    }
    if (month == 0) {
        return std::nullopt;
    }

    unsigned day = 0;
    int year = 0;
    int hour = 0;
    int minute = 0;
    int second = 0;
    int consumed = 0;
    const int fields = std::sscanf(text.c_str() + space + 1, "%u, %d, %d:%d:%d%n",
                                   &day, &year, &hour, &minute, &second, &consumed);
    if (fields != 5 || text.size() != space + 1 + static_cast<size_t>(consumed)) {
        return std::nullopt;
    }

    const std::chrono::year_month_day ymd{std::chrono::year{year},
                                          std::chrono::month{month},
                                          std::chrono::day{day}};
    if (!ymd.ok() || hour < 0 || hour > 23 || minute < 0 || minute > 59 ||
        second < 0 || second > 59) {
        return std::nullopt;
    }

    return makeSimTime(year, month, day, hour, minute, second);
}

} // namespace Smallville

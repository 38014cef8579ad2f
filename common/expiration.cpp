/*
 * Filename: expiration.cpp
 * Developer: Benjamin Cance
 * Date: 5/31/2025
 * 
 * Copyright 2025 Open Quant Desk, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You may obtain a copy of the License at
 *
 *     http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#include "expiration.hpp"
#include "math/core/types.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>

namespace common {

ExpirationDate ExpirationDate::fromDays(double days) {
    return ExpirationDate(Kind::DAYS, days, {});
}

ExpirationDate ExpirationDate::fromYears(double years) {
    return ExpirationDate(Kind::DAYS, years * math::core::DAYS_IN_YEAR, {});
}

ExpirationDate ExpirationDate::fromDate(std::chrono::system_clock::time_point date) {
    return ExpirationDate(Kind::DATE, 0.0, date);
}

Result<ExpirationDate> ExpirationDate::parse(const std::string& text) {
    std::tm tm = {};
    std::istringstream ss(text);
    ss >> std::get_time(&tm, "%Y-%m-%d");

    if (ss.fail()) {
        return makeError<ExpirationDate>(ErrorCode::PARSE_ERROR,
                                         "expiration '" + text + "' is not a YYYY-MM-DD date");
    }

    // Options expire at the close; anchor the date at 16:00 local time.
    tm.tm_hour = 16;
    tm.tm_isdst = -1;
    return fromDate(std::chrono::system_clock::from_time_t(std::mktime(&tm)));
}

double ExpirationDate::getDays() const {
    return getDays(std::chrono::system_clock::now());
}

double ExpirationDate::getDays(std::chrono::system_clock::time_point reference) const {
    if (kind_ == Kind::DAYS) {
        return days_;
    }
    auto duration = std::chrono::duration_cast<std::chrono::seconds>(date_ - reference);
    return duration.count() / 86400.0;
}

double ExpirationDate::getYears() const {
    return getDays() / math::core::DAYS_IN_YEAR;
}

double ExpirationDate::getYears(std::chrono::system_clock::time_point reference) const {
    return getDays(reference) / math::core::DAYS_IN_YEAR;
}

std::string ExpirationDate::toString() const {
    std::ostringstream ss;
    if (kind_ == Kind::DAYS) {
        ss << days_ << " days";
    } else {
        const std::time_t time = std::chrono::system_clock::to_time_t(date_);
        std::tm tm = *std::localtime(&time);
        ss << std::put_time(&tm, "%Y-%m-%d");
    }
    return ss.str();
}

std::ostream& operator<<(std::ostream& os, const ExpirationDate& expiration) {
    return os << expiration.toString();
}

}

/*
 * Filename: expiration.hpp
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

#pragma once

#include "result.hpp"
#include <chrono>
#include <ostream>
#include <string>

namespace common {

class ExpirationDate {
public:
    enum class Kind { DAYS, DATE };

private:
    Kind kind_;
    double days_;
    std::chrono::system_clock::time_point date_;

    ExpirationDate(Kind kind, double days, std::chrono::system_clock::time_point date)
        : kind_(kind), days_(days), date_(date) {}

public:
    ExpirationDate() : ExpirationDate(Kind::DAYS, 0.0, {}) {}

    static ExpirationDate fromDays(double days);
    static ExpirationDate fromYears(double years);
    static ExpirationDate fromDate(std::chrono::system_clock::time_point date);
    static Result<ExpirationDate> parse(const std::string& text);

    Kind getKind() const { return kind_; }

    double getDays() const;
    double getDays(std::chrono::system_clock::time_point reference) const;
    double getYears() const;
    double getYears(std::chrono::system_clock::time_point reference) const;

    std::string toString() const;
};

std::ostream& operator<<(std::ostream& os, const ExpirationDate& expiration);

}

/*
 * Filename: fixtures.hpp
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

#include "common/option.hpp"
#include "portfolio/position.hpp"
#include <string>

namespace fixtures {

constexpr double SPOT = 100.0;
constexpr double RATE = 0.05;
constexpr double VOLATILITY = 0.2;
constexpr double DIVIDEND = 0.01;
constexpr double DAYS = 30.0;

inline common::Option makeOption(common::Side side, common::OptionStyle style, double strike,
                                 double quantity = 1.0, double spot = SPOT,
                                 double volatility = VOLATILITY, double dividend = DIVIDEND,
                                 double days = DAYS) {
    return common::Option(side, style, "SPY", strike, common::ExpirationDate::fromDays(days),
                          volatility, quantity, spot, RATE, dividend);
}

// One-year at-the-money contract with no dividend, the textbook case.
inline common::Option textbookOption(common::OptionStyle style, common::Side side = common::Side::LONG) {
    return common::Option(side, style, "SPY", 100.0, common::ExpirationDate::fromYears(1.0),
                          0.2, 1.0, 100.0, 0.05, 0.0);
}

inline portfolio::Position makePosition(common::Side side, common::OptionStyle style, double strike,
                                        double quantity = 1.0, double premium = 0.0) {
    return portfolio::Position(makeOption(side, style, strike, quantity), premium);
}

}

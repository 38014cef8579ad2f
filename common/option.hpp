/*
 * Filename: option.hpp
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

#include "types.hpp"
#include "expiration.hpp"
#include "interfaces/greeks.hpp"
#include <ostream>
#include <string>
#include <vector>

namespace common {

class Option : public math::greeks::IGreeks {
public:
    std::string underlyingSymbol;
    double underlyingPrice = 0.0;
    double strikePrice = 0.0;
    double riskFreeRate = 0.0;
    ExpirationDate expirationDate;
    double impliedVolatility = 0.0;
    double dividendYield = 0.0;
    OptionStyle optionStyle = OptionStyle::CALL;
    double quantity = 1.0;
    Side side = Side::LONG;

    Option() = default;
    Option(Side side, OptionStyle style, const std::string& symbol,
           double strike, const ExpirationDate& expiration, double volatility,
           double quantity, double underlyingPrice, double riskFreeRate,
           double dividendYield);

    Result<std::vector<Option>> getOptions() const override;

    Result<bool> validate() const;

    bool isLong() const { return side == Side::LONG; }
    bool isShort() const { return side == Side::SHORT; }
    bool isCall() const { return optionStyle == OptionStyle::CALL; }
    bool isPut() const { return optionStyle == OptionStyle::PUT; }
    bool isInTheMoney() const;

    double timeToExpiration() const { return expirationDate.getYears(); }

    bool matches(double strike, OptionStyle style, Side legSide) const;
};

std::ostream& operator<<(std::ostream& os, const Option& option);

}

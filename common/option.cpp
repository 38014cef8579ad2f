/*
 * Filename: option.cpp
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

#include "option.hpp"
#include <cmath>
#include <sstream>

namespace common {

Option::Option(Side side, OptionStyle style, const std::string& symbol,
               double strike, const ExpirationDate& expiration, double volatility,
               double quantity, double underlyingPrice, double riskFreeRate,
               double dividendYield)
    : underlyingSymbol(symbol),
      underlyingPrice(underlyingPrice),
      strikePrice(strike),
      riskFreeRate(riskFreeRate),
      expirationDate(expiration),
      impliedVolatility(volatility),
      dividendYield(dividendYield),
      optionStyle(style),
      quantity(quantity),
      side(side) {}

Result<std::vector<Option>> Option::getOptions() const {
    return std::vector<Option>{*this};
}

Result<bool> Option::validate() const {
    if (!(underlyingPrice > 0.0)) {
        return makeError<bool>(ErrorCode::INVALID_PRICE, "underlying price must be positive");
    }
    if (!(strikePrice > 0.0)) {
        return makeError<bool>(ErrorCode::INVALID_STRIKE, "strike price must be positive");
    }
    if (!(impliedVolatility >= 0.0)) {
        return makeError<bool>(ErrorCode::INVALID_VOLATILITY, "implied volatility cannot be negative");
    }
    if (!(timeToExpiration() > 0.0)) {
        return makeError<bool>(ErrorCode::INVALID_TIME, "option is expired");
    }
    if (!std::isfinite(riskFreeRate)) {
        return makeError<bool>(ErrorCode::INVALID_RATE, "risk-free rate must be finite");
    }
    if (!(dividendYield >= 0.0)) {
        return makeError<bool>(ErrorCode::INVALID_RATE, "dividend yield cannot be negative");
    }
    if (!(quantity >= 0.0)) {
        return makeError<bool>(ErrorCode::INVALID_QUANTITY, "quantity cannot be negative");
    }
    return true;
}

bool Option::isInTheMoney() const {
    return isCall() ? underlyingPrice >= strikePrice : underlyingPrice <= strikePrice;
}

bool Option::matches(double strike, OptionStyle style, Side legSide) const {
    return strikePrice == strike && optionStyle == style && side == legSide;
}

std::ostream& operator<<(std::ostream& os, const Option& option) {
    os << option.side << " " << option.optionStyle << " " << option.underlyingSymbol
       << " K=" << option.strikePrice
       << " S=" << option.underlyingPrice
       << " exp=" << option.expirationDate
       << " iv=" << option.impliedVolatility
       << " qty=" << option.quantity;
    return os;
}

}

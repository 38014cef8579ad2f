/*
 * Filename: base.cpp
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

#include "strategy/base.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>

namespace strategy {

BaseStrategy::BaseStrategy(std::string name, std::string symbol, double underlyingPrice,
                           std::string description)
    : name_(std::move(name)), symbol_(std::move(symbol)), underlyingPrice_(underlyingPrice),
      description_(std::move(description)) {}

portfolio::Position BaseStrategy::makeLeg(const StrategyParams& params, common::Side side,
                                          common::OptionStyle style, double strike,
                                          double premium) const {
    common::Option option(side, style, params.symbol, strike, params.expiration,
                          params.impliedVolatility, params.quantity, params.underlyingPrice,
                          params.riskFreeRate, params.dividendYield);
    return portfolio::Position(option, premium, params.openFee, params.closeFee);
}

common::Result<bool> BaseStrategy::replaceLeg(const portfolio::Position& position) {
    const auto& option = position.getOption();
    if (option.underlyingSymbol != symbol_) {
        return common::makeError<bool>(common::ErrorCode::INVALID_STRATEGY,
                                       "leg on " + option.underlyingSymbol + " does not belong to " +
                                       symbol_ + " " + name_);
    }

    for (auto& leg : positions_) {
        if (leg.getOption().optionStyle == option.optionStyle && leg.getOption().side == option.side) {
            leg = position;
            return true;
        }
    }

    std::ostringstream ss;
    ss << name_ << " has no " << option.side << " " << option.optionStyle << " leg";
    return common::makeError<bool>(common::ErrorCode::INVALID_STRATEGY, ss.str());
}

const portfolio::Position* BaseStrategy::findLeg(common::OptionStyle style, common::Side side) const {
    for (const auto& leg : positions_) {
        if (leg.getOption().optionStyle == style && leg.getOption().side == side) {
            return &leg;
        }
    }
    return nullptr;
}

common::Result<std::vector<common::Option>> BaseStrategy::getOptions() const {
    if (positions_.empty()) {
        return common::makeError<std::vector<common::Option>>(common::ErrorCode::RETRIEVAL_ERROR,
                                                              name_ + " has no positions");
    }

    std::vector<common::Option> options;
    options.reserve(positions_.size());
    for (const auto& position : positions_) {
        options.push_back(position.getOption());
    }
    return options;
}

common::Result<std::vector<const portfolio::Position*>> BaseStrategy::getPositions() const {
    std::vector<const portfolio::Position*> positions;
    positions.reserve(positions_.size());
    for (const auto& position : positions_) {
        positions.push_back(&position);
    }
    return positions;
}

common::Result<std::vector<portfolio::Position*>> BaseStrategy::getMutablePositions() {
    std::vector<portfolio::Position*> positions;
    positions.reserve(positions_.size());
    for (auto& position : positions_) {
        positions.push_back(&position);
    }
    return positions;
}

common::Result<bool> BaseStrategy::setUnderlyingPrice(double price) {
    if (!std::isfinite(price) || price <= 0.0) {
        return common::makeError<bool>(common::ErrorCode::INVALID_PRICE,
                                       "underlying price must be positive");
    }
    underlyingPrice_ = price;
    for (auto& position : positions_) {
        position.setUnderlyingPrice(price);
    }
    return true;
}

common::Result<double> BaseStrategy::getAtmStrike() const {
    if (positions_.empty()) {
        return common::makeError<double>(common::ErrorCode::RETRIEVAL_ERROR,
                                         name_ + " has no positions");
    }

    double best = positions_.front().getStrike();
    for (const auto& position : positions_) {
        const double strike = position.getStrike();
        if (std::abs(strike - underlyingPrice_) < std::abs(best - underlyingPrice_)) {
            best = strike;
        }
    }
    return best;
}

std::vector<double> BaseStrategy::getStrikes() const {
    std::vector<double> strikes;
    for (const auto& position : positions_) {
        strikes.push_back(position.getStrike());
    }
    std::sort(strikes.begin(), strikes.end());
    strikes.erase(std::unique(strikes.begin(), strikes.end()), strikes.end());
    return strikes;
}

common::Result<bool> BaseStrategy::validate() const {
    if (positions_.empty()) {
        return common::makeError<bool>(common::ErrorCode::INVALID_STRATEGY, name_ + " has no positions");
    }
    if (!(underlyingPrice_ > 0.0)) {
        return common::makeError<bool>(common::ErrorCode::INVALID_PRICE,
                                       "underlying price must be positive");
    }

    for (const auto& position : positions_) {
        if (position.getOption().underlyingSymbol != symbol_) {
            return common::makeError<bool>(common::ErrorCode::INVALID_STRATEGY,
                                           "all legs must be on " + symbol_);
        }
        auto valid = position.validate();
        if (!common::isSuccess(valid)) {
            return valid;
        }
    }
    return validateShape();
}

double BaseStrategy::netCost() const {
    double total = 0.0;
    for (const auto& position : positions_) {
        total += position.netCost();
    }
    return total;
}

common::Result<double> BaseStrategy::theoreticalValue() const {
    double total = 0.0;
    for (const auto& position : positions_) {
        auto value = position.theoreticalValue();
        if (!common::isSuccess(value)) {
            return value;
        }
        total += position.isLong() ? common::getValue(value) : -common::getValue(value);
    }
    return total;
}

}

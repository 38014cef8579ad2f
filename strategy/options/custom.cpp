/*
 * Filename: custom.cpp
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

#include "strategy/options/custom.hpp"
#include <algorithm>
#include <sstream>

namespace strategy {

CustomStrategy::CustomStrategy(const std::string& name, const std::string& symbol,
                               double underlyingPrice, const std::string& description)
    : BaseStrategy(name, symbol, underlyingPrice, description) {}

common::Result<bool> CustomStrategy::addPosition(const portfolio::Position& position) {
    const auto& option = position.getOption();
    if (option.underlyingSymbol != symbol_) {
        return common::makeError<bool>(common::ErrorCode::INVALID_STRATEGY,
                                       "leg on " + option.underlyingSymbol + " does not belong to " +
                                       symbol_ + " " + name_);
    }

    // Legs are addressed by (strike, style, side), so each key may appear once.
    for (const auto& leg : positions_) {
        if (leg.matches(option.strikePrice, option.optionStyle, option.side)) {
            std::ostringstream ss;
            ss << name_ << " already holds " << option.side << " " << option.optionStyle
               << " @ " << option.strikePrice;
            return common::makeError<bool>(common::ErrorCode::INVALID_STRATEGY, ss.str());
        }
    }

    positions_.push_back(position);
    return true;
}

common::Result<bool> CustomStrategy::removePosition(double strike, common::OptionStyle style,
                                                    common::Side side) {
    auto it = std::find_if(positions_.begin(), positions_.end(),
                           [&](const portfolio::Position& leg) { return leg.matches(strike, style, side); });
    if (it == positions_.end()) {
        std::ostringstream ss;
        ss << "no " << side << " " << style << " position at strike " << strike;
        return common::makeError<bool>(common::ErrorCode::POSITION_NOT_FOUND, ss.str());
    }
    positions_.erase(it);
    return true;
}

}

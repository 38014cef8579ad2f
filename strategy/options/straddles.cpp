/*
 * Filename: straddles.cpp
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

#include "strategy/options/straddles.hpp"

namespace strategy {

using common::OptionStyle;
using common::Side;

namespace {

common::Result<bool> checkStraddleStrikes(const portfolio::Position& call, const portfolio::Position& put) {
    if (call.getStrike() != put.getStrike()) {
        return common::makeError<bool>(common::ErrorCode::INVALID_STRIKE,
                                       "straddle legs must share one strike");
    }
    return true;
}

}

ShortStraddle::ShortStraddle(const StrategyParams& params, double strike,
                             double callPremium, double putPremium)
    : BaseStrategy("Short Straddle", params.symbol, params.underlyingPrice,
                   "Sells a call and a put at the same strike") {
    positions_.push_back(makeLeg(params, Side::SHORT, OptionStyle::CALL, strike, callPremium));
    positions_.push_back(makeLeg(params, Side::SHORT, OptionStyle::PUT, strike, putPremium));
}

common::Result<bool> ShortStraddle::addPosition(const portfolio::Position& position) {
    return replaceLeg(position);
}

const portfolio::Position& ShortStraddle::getShortCall() const {
    return *findLeg(OptionStyle::CALL, Side::SHORT);
}

const portfolio::Position& ShortStraddle::getShortPut() const {
    return *findLeg(OptionStyle::PUT, Side::SHORT);
}

common::Result<bool> ShortStraddle::validateShape() const {
    return checkStraddleStrikes(getShortCall(), getShortPut());
}

LongStraddle::LongStraddle(const StrategyParams& params, double strike,
                           double callPremium, double putPremium)
    : BaseStrategy("Long Straddle", params.symbol, params.underlyingPrice,
                   "Buys a call and a put at the same strike") {
    positions_.push_back(makeLeg(params, Side::LONG, OptionStyle::CALL, strike, callPremium));
    positions_.push_back(makeLeg(params, Side::LONG, OptionStyle::PUT, strike, putPremium));
}

common::Result<bool> LongStraddle::addPosition(const portfolio::Position& position) {
    return replaceLeg(position);
}

const portfolio::Position& LongStraddle::getLongCall() const {
    return *findLeg(OptionStyle::CALL, Side::LONG);
}

const portfolio::Position& LongStraddle::getLongPut() const {
    return *findLeg(OptionStyle::PUT, Side::LONG);
}

common::Result<bool> LongStraddle::validateShape() const {
    return checkStraddleStrikes(getLongCall(), getLongPut());
}

}

/*
 * Filename: strangles.cpp
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

#include "strategy/options/strangles.hpp"

namespace strategy {

using common::OptionStyle;
using common::Side;

namespace {

common::Result<bool> checkStrangleStrikes(const portfolio::Position& call, const portfolio::Position& put) {
    if (!(call.getStrike() > put.getStrike())) {
        return common::makeError<bool>(common::ErrorCode::INVALID_STRIKE,
                                       "strangle call strike must be above the put strike");
    }
    return true;
}

}

ShortStrangle::ShortStrangle(const StrategyParams& params, double callStrike, double putStrike,
                             double callPremium, double putPremium)
    : BaseStrategy("Short Strangle", params.symbol, params.underlyingPrice,
                   "Sells an out-of-the-money call and put, collecting premium in a range") {
    positions_.push_back(makeLeg(params, Side::SHORT, OptionStyle::CALL, callStrike, callPremium));
    positions_.push_back(makeLeg(params, Side::SHORT, OptionStyle::PUT, putStrike, putPremium));
}

common::Result<bool> ShortStrangle::addPosition(const portfolio::Position& position) {
    return replaceLeg(position);
}

const portfolio::Position& ShortStrangle::getShortCall() const {
    return *findLeg(OptionStyle::CALL, Side::SHORT);
}

const portfolio::Position& ShortStrangle::getShortPut() const {
    return *findLeg(OptionStyle::PUT, Side::SHORT);
}

common::Result<bool> ShortStrangle::validateShape() const {
    return checkStrangleStrikes(getShortCall(), getShortPut());
}

LongStrangle::LongStrangle(const StrategyParams& params, double callStrike, double putStrike,
                           double callPremium, double putPremium)
    : BaseStrategy("Long Strangle", params.symbol, params.underlyingPrice,
                   "Buys an out-of-the-money call and put to profit from a large move") {
    positions_.push_back(makeLeg(params, Side::LONG, OptionStyle::CALL, callStrike, callPremium));
    positions_.push_back(makeLeg(params, Side::LONG, OptionStyle::PUT, putStrike, putPremium));
}

common::Result<bool> LongStrangle::addPosition(const portfolio::Position& position) {
    return replaceLeg(position);
}

const portfolio::Position& LongStrangle::getLongCall() const {
    return *findLeg(OptionStyle::CALL, Side::LONG);
}

const portfolio::Position& LongStrangle::getLongPut() const {
    return *findLeg(OptionStyle::PUT, Side::LONG);
}

common::Result<bool> LongStrangle::validateShape() const {
    return checkStrangleStrikes(getLongCall(), getLongPut());
}

}

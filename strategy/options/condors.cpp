/*
 * Filename: condors.cpp
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

#include "strategy/options/condors.hpp"
#include <algorithm>

namespace strategy {

using common::OptionStyle;
using common::Side;

IronCondorStrategy::IronCondorStrategy(const StrategyParams& params, double shortCallStrike,
                                       double shortPutStrike, double longCallStrike,
                                       double longPutStrike, const IronCondorPremiums& premiums)
    : BaseStrategy("Iron Condor", params.symbol, params.underlyingPrice,
                   "Short strangle with long wings, a defined-risk range trade") {
    positions_.push_back(makeLeg(params, Side::SHORT, OptionStyle::CALL, shortCallStrike, premiums.shortCall));
    positions_.push_back(makeLeg(params, Side::SHORT, OptionStyle::PUT, shortPutStrike, premiums.shortPut));
    positions_.push_back(makeLeg(params, Side::LONG, OptionStyle::CALL, longCallStrike, premiums.longCall));
    positions_.push_back(makeLeg(params, Side::LONG, OptionStyle::PUT, longPutStrike, premiums.longPut));
}

common::Result<bool> IronCondorStrategy::addPosition(const portfolio::Position& position) {
    return replaceLeg(position);
}

const portfolio::Position& IronCondorStrategy::getShortCall() const {
    return *findLeg(OptionStyle::CALL, Side::SHORT);
}

const portfolio::Position& IronCondorStrategy::getShortPut() const {
    return *findLeg(OptionStyle::PUT, Side::SHORT);
}

const portfolio::Position& IronCondorStrategy::getLongCall() const {
    return *findLeg(OptionStyle::CALL, Side::LONG);
}

const portfolio::Position& IronCondorStrategy::getLongPut() const {
    return *findLeg(OptionStyle::PUT, Side::LONG);
}

double IronCondorStrategy::creditReceived() const {
    const double credit = getShortCall().getPremium() + getShortPut().getPremium() -
                          getLongCall().getPremium() - getLongPut().getPremium();
    return credit * getShortCall().getQuantity();
}

double IronCondorStrategy::maxLoss() const {
    const double callWidth = getLongCall().getStrike() - getShortCall().getStrike();
    const double putWidth = getShortPut().getStrike() - getLongPut().getStrike();
    return std::max(callWidth, putWidth) * getShortCall().getQuantity() - creditReceived();
}

common::Result<bool> IronCondorStrategy::validateShape() const {
    const double longPut = getLongPut().getStrike();
    const double shortPut = getShortPut().getStrike();
    const double shortCall = getShortCall().getStrike();
    const double longCall = getLongCall().getStrike();

    if (!(longPut < shortPut && shortPut < shortCall && shortCall < longCall)) {
        return common::makeError<bool>(common::ErrorCode::INVALID_STRIKE,
                                       "iron condor strikes must satisfy long put < short put < "
                                       "short call < long call");
    }
    return true;
}

}

/*
 * Filename: spreads.cpp
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

#include "strategy/options/spreads.hpp"

namespace strategy {

using common::OptionStyle;
using common::Side;

BullCallSpread::BullCallSpread(const StrategyParams& params, double longStrike, double shortStrike,
                               double longPremium, double shortPremium)
    : BaseStrategy("Bull Call Spread", params.symbol, params.underlyingPrice,
                   "Debit call spread that profits from a moderate rise") {
    positions_.push_back(makeLeg(params, Side::LONG, OptionStyle::CALL, longStrike, longPremium));
    positions_.push_back(makeLeg(params, Side::SHORT, OptionStyle::CALL, shortStrike, shortPremium));
}

common::Result<bool> BullCallSpread::addPosition(const portfolio::Position& position) {
    return replaceLeg(position);
}

const portfolio::Position& BullCallSpread::getLongCall() const {
    return *findLeg(OptionStyle::CALL, Side::LONG);
}

const portfolio::Position& BullCallSpread::getShortCall() const {
    return *findLeg(OptionStyle::CALL, Side::SHORT);
}

// Per spread, assuming equal leg quantities.
double BullCallSpread::maxProfit() const {
    const double width = getShortCall().getStrike() - getLongCall().getStrike();
    return (width - getLongCall().getPremium() + getShortCall().getPremium()) *
           getLongCall().getQuantity();
}

double BullCallSpread::maxLoss() const {
    return (getLongCall().getPremium() - getShortCall().getPremium()) * getLongCall().getQuantity();
}

common::Result<bool> BullCallSpread::validateShape() const {
    if (!(getLongCall().getStrike() < getShortCall().getStrike())) {
        return common::makeError<bool>(common::ErrorCode::INVALID_STRIKE,
                                       "bull call spread long strike must be below the short strike");
    }
    return true;
}

BearPutSpread::BearPutSpread(const StrategyParams& params, double longStrike, double shortStrike,
                             double longPremium, double shortPremium)
    : BaseStrategy("Bear Put Spread", params.symbol, params.underlyingPrice,
                   "Debit put spread that profits from a moderate decline") {
    positions_.push_back(makeLeg(params, Side::LONG, OptionStyle::PUT, longStrike, longPremium));
    positions_.push_back(makeLeg(params, Side::SHORT, OptionStyle::PUT, shortStrike, shortPremium));
}

common::Result<bool> BearPutSpread::addPosition(const portfolio::Position& position) {
    return replaceLeg(position);
}

const portfolio::Position& BearPutSpread::getLongPut() const {
    return *findLeg(OptionStyle::PUT, Side::LONG);
}

const portfolio::Position& BearPutSpread::getShortPut() const {
    return *findLeg(OptionStyle::PUT, Side::SHORT);
}

double BearPutSpread::maxProfit() const {
    const double width = getLongPut().getStrike() - getShortPut().getStrike();
    return (width - getLongPut().getPremium() + getShortPut().getPremium()) *
           getLongPut().getQuantity();
}

double BearPutSpread::maxLoss() const {
    return (getLongPut().getPremium() - getShortPut().getPremium()) * getLongPut().getQuantity();
}

common::Result<bool> BearPutSpread::validateShape() const {
    if (!(getLongPut().getStrike() > getShortPut().getStrike())) {
        return common::makeError<bool>(common::ErrorCode::INVALID_STRIKE,
                                       "bear put spread long strike must be above the short strike");
    }
    return true;
}

}

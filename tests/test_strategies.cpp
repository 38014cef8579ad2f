/*
 * Filename: test_strategies.cpp
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

#include <gtest/gtest.h>
#include "fixtures.hpp"
#include "strategy/options/condors.hpp"
#include "strategy/options/custom.hpp"
#include "strategy/options/spreads.hpp"
#include "strategy/options/straddles.hpp"
#include "strategy/options/strangles.hpp"
#include <cmath>
#include <vector>

using common::OptionStyle;
using common::Side;
using fixtures::makeOption;
using fixtures::makePosition;

namespace {

strategy::StrategyParams params(double spot = 100.0) {
    strategy::StrategyParams p;
    p.symbol = "SPY";
    p.underlyingPrice = spot;
    p.expiration = common::ExpirationDate::fromDays(45.0);
    p.impliedVolatility = 0.22;
    p.riskFreeRate = 0.04;
    p.dividendYield = 0.0;
    p.quantity = 2.0;
    return p;
}

}

TEST(ShortStrangleTest, BuildsTwoShortLegs) {
    strategy::ShortStrangle strangle(params(), 110.0, 90.0, 1.2, 1.1);

    EXPECT_EQ(strangle.getName(), "Short Strangle");
    EXPECT_EQ(strangle.getSymbol(), "SPY");
    EXPECT_FALSE(strangle.getDescription().empty());
    EXPECT_TRUE(strangle.getShortCall().isShort());
    EXPECT_DOUBLE_EQ(strangle.getShortCall().getStrike(), 110.0);
    EXPECT_DOUBLE_EQ(strangle.getShortPut().getStrike(), 90.0);
    EXPECT_DOUBLE_EQ(strangle.getShortPut().getQuantity(), 2.0);
    EXPECT_TRUE(common::isSuccess(strangle.validate()));
    EXPECT_NEAR(strangle.netCost(), -(1.2 + 1.1) * 2.0, 1e-12);
}

TEST(ShortStrangleTest, InvertedStrikesAreInvalid) {
    strategy::ShortStrangle strangle(params(), 90.0, 110.0);
    auto result = strangle.validate();
    ASSERT_FALSE(common::isSuccess(result));
    EXPECT_EQ(common::getError(result).code, common::ErrorCode::INVALID_STRIKE);
}

TEST(ShortStrangleTest, AddPositionReplacesMatchingLeg) {
    strategy::ShortStrangle strangle(params(), 110.0, 90.0);

    ASSERT_TRUE(common::isSuccess(strangle.addPosition(makePosition(Side::SHORT, OptionStyle::CALL, 115.0, 3.0))));
    EXPECT_DOUBLE_EQ(strangle.getShortCall().getStrike(), 115.0);
    EXPECT_DOUBLE_EQ(strangle.getShortCall().getQuantity(), 3.0);
    EXPECT_EQ(strangle.getStrikes().size(), 2u);

    auto foreign = strangle.addPosition(makePosition(Side::LONG, OptionStyle::CALL, 120.0));
    ASSERT_FALSE(common::isSuccess(foreign));
    EXPECT_EQ(common::getError(foreign).code, common::ErrorCode::INVALID_STRATEGY);
}

TEST(ShortStrangleTest, RejectsOtherUnderlying) {
    strategy::ShortStrangle strangle(params(), 110.0, 90.0);
    common::Option qqq(Side::SHORT, OptionStyle::CALL, "QQQ", 110.0, common::ExpirationDate::fromDays(45.0),
                       0.2, 1.0, 100.0, 0.04, 0.0);

    auto result = strangle.addPosition(portfolio::Position(qqq, 1.0));
    ASSERT_FALSE(common::isSuccess(result));
    EXPECT_EQ(common::getError(result).code, common::ErrorCode::INVALID_STRATEGY);
}

TEST(LongStrangleTest, IsLongVegaWithSmallDelta) {
    strategy::LongStrangle strangle(params(), 110.0, 90.0);

    EXPECT_TRUE(common::isSuccess(strangle.validate()));
    EXPECT_GT(common::getValue(strangle.vega()), 0.0);
    EXPECT_LT(std::abs(common::getValue(strangle.delta())), 0.5);
}

TEST(StraddleTest, LegsShareOneStrike) {
    strategy::ShortStraddle shortStraddle(params(), 100.0);
    strategy::LongStraddle longStraddle(params(), 100.0);

    EXPECT_TRUE(common::isSuccess(shortStraddle.validate()));
    EXPECT_TRUE(common::isSuccess(longStraddle.validate()));
    EXPECT_NEAR(common::getValue(shortStraddle.delta()), -common::getValue(longStraddle.delta()), 1e-12);

    ASSERT_TRUE(common::isSuccess(longStraddle.addPosition(
        portfolio::Position(makeOption(Side::LONG, OptionStyle::PUT, 95.0, 2.0), 0.0))));
    auto result = longStraddle.validate();
    ASSERT_FALSE(common::isSuccess(result));
    EXPECT_EQ(common::getError(result).code, common::ErrorCode::INVALID_STRIKE);
}

TEST(SpreadTest, BullCallSpread) {
    strategy::BullCallSpread spread(params(), 95.0, 105.0, 7.0, 2.0);

    EXPECT_TRUE(common::isSuccess(spread.validate()));
    EXPECT_DOUBLE_EQ(spread.maxLoss(), (7.0 - 2.0) * 2.0);
    EXPECT_DOUBLE_EQ(spread.maxProfit(), (10.0 - 5.0) * 2.0);
    EXPECT_GT(common::getValue(spread.delta()), 0.0);

    strategy::BullCallSpread inverted(params(), 105.0, 95.0);
    EXPECT_EQ(common::getError(inverted.validate()).code, common::ErrorCode::INVALID_STRIKE);
}

TEST(SpreadTest, BearPutSpread) {
    strategy::BearPutSpread spread(params(), 105.0, 95.0, 6.5, 2.5);

    EXPECT_TRUE(common::isSuccess(spread.validate()));
    EXPECT_DOUBLE_EQ(spread.maxLoss(), 4.0 * 2.0);
    EXPECT_DOUBLE_EQ(spread.maxProfit(), 6.0 * 2.0);
    EXPECT_LT(common::getValue(spread.delta()), 0.0);

    strategy::BearPutSpread inverted(params(), 95.0, 105.0);
    EXPECT_EQ(common::getError(inverted.validate()).code, common::ErrorCode::INVALID_STRIKE);
}

TEST(IronCondorTest, StrikeOrderingAndCredit) {
    strategy::IronCondorPremiums premiums;
    premiums.shortCall = 1.5;
    premiums.shortPut = 1.4;
    premiums.longCall = 0.5;
    premiums.longPut = 0.4;
    strategy::IronCondorStrategy condor(params(), 110.0, 90.0, 120.0, 80.0, premiums);

    EXPECT_EQ(condor.getName(), "Iron Condor");
    EXPECT_TRUE(common::isSuccess(condor.validate()));
    EXPECT_NEAR(condor.creditReceived(), 2.0 * 2.0, 1e-12);
    EXPECT_NEAR(condor.maxLoss(), 10.0 * 2.0 - 4.0, 1e-12);
    EXPECT_EQ(condor.getStrikes(), (std::vector<double>{80.0, 90.0, 110.0, 120.0}));

    strategy::IronCondorStrategy broken(params(), 110.0, 90.0, 105.0, 80.0);
    EXPECT_EQ(common::getError(broken.validate()).code, common::ErrorCode::INVALID_STRIKE);
}

TEST(BaseStrategyTest, UnderlyingPricePropagatesToLegs) {
    strategy::IronCondorStrategy condor(params(), 110.0, 90.0, 120.0, 80.0);

    ASSERT_TRUE(common::isSuccess(condor.setUnderlyingPrice(108.0)));
    EXPECT_DOUBLE_EQ(condor.getUnderlyingPrice(), 108.0);
    auto positions = condor.getPositions();
    ASSERT_TRUE(common::isSuccess(positions));
    for (const auto* position : common::getValue(positions)) {
        EXPECT_DOUBLE_EQ(position->getOption().underlyingPrice, 108.0);
    }

    auto invalid = condor.setUnderlyingPrice(-1.0);
    ASSERT_FALSE(common::isSuccess(invalid));
    EXPECT_EQ(common::getError(invalid).code, common::ErrorCode::INVALID_PRICE);
    EXPECT_DOUBLE_EQ(condor.getUnderlyingPrice(), 108.0);
}

TEST(BaseStrategyTest, AtmStrikeIsNearestLeg) {
    strategy::IronCondorStrategy condor(params(), 110.0, 90.0, 120.0, 80.0);
    // Equidistant strikes resolve to the first leg.
    EXPECT_DOUBLE_EQ(common::getValue(condor.getAtmStrike()), 110.0);

    ASSERT_TRUE(common::isSuccess(condor.setUnderlyingPrice(93.0)));
    EXPECT_DOUBLE_EQ(common::getValue(condor.getAtmStrike()), 90.0);

    strategy::CustomStrategy empty("Empty", "SPY", 100.0);
    EXPECT_EQ(common::getError(empty.getAtmStrike()).code, common::ErrorCode::RETRIEVAL_ERROR);
    EXPECT_EQ(common::getError(empty.validate()).code, common::ErrorCode::INVALID_STRATEGY);
}

TEST(CustomStrategyTest, LegsAreKeyedByStrikeStyleSide) {
    strategy::CustomStrategy custom("Ratio Spread", "SPY", 100.0, "One long call, two short calls");

    ASSERT_TRUE(common::isSuccess(custom.addPosition(makePosition(Side::LONG, OptionStyle::CALL, 100.0))));
    ASSERT_TRUE(common::isSuccess(custom.addPosition(makePosition(Side::SHORT, OptionStyle::CALL, 105.0, 2.0))));
    EXPECT_EQ(common::getValue(custom.getPositions()).size(), 2u);
    EXPECT_TRUE(common::isSuccess(custom.validate()));

    auto duplicate = custom.addPosition(makePosition(Side::LONG, OptionStyle::CALL, 100.0));
    EXPECT_EQ(common::getError(duplicate).code, common::ErrorCode::INVALID_STRATEGY);

    auto missing = custom.removePosition(110.0, OptionStyle::CALL, Side::SHORT);
    EXPECT_EQ(common::getError(missing).code, common::ErrorCode::POSITION_NOT_FOUND);
    ASSERT_TRUE(common::isSuccess(custom.removePosition(100.0, OptionStyle::CALL, Side::LONG)));
    EXPECT_EQ(common::getValue(custom.getPositions()).size(), 1u);
}

TEST(PositionableTest, FindAndModify) {
    strategy::ShortStrangle strangle(params(), 110.0, 90.0);

    auto found = strangle.findPosition(90.0, OptionStyle::PUT, Side::SHORT);
    ASSERT_TRUE(common::isSuccess(found));
    EXPECT_DOUBLE_EQ(common::getValue(found)->getStrike(), 90.0);

    auto missing = strangle.findPosition(90.0, OptionStyle::PUT, Side::LONG);
    EXPECT_EQ(common::getError(missing).code, common::ErrorCode::POSITION_NOT_FOUND);

    portfolio::Position updated = strangle.getShortPut();
    updated.setQuantity(5.0);
    updated.setPremium(0.75);
    ASSERT_TRUE(common::isSuccess(strangle.modifyPosition(updated)));
    EXPECT_DOUBLE_EQ(strangle.getShortPut().getQuantity(), 5.0);
    EXPECT_DOUBLE_EQ(strangle.getShortPut().getPremium(), 0.75);

    updated.getOption().strikePrice = 85.0;
    EXPECT_EQ(common::getError(strangle.modifyPosition(updated)).code, common::ErrorCode::POSITION_NOT_FOUND);
}

/*
 * Filename: test_position.cpp
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
#include "math/pricing/black_scholes.hpp"
#include "portfolio/position.hpp"

using common::OptionStyle;
using common::Side;
using fixtures::makeOption;

TEST(PositionTest, LongPaysPremiumAndFees) {
    portfolio::Position position(makeOption(Side::LONG, OptionStyle::CALL, 100.0, 2.0), 2.0, 0.5, 0.5);

    EXPECT_DOUBLE_EQ(position.totalCost(), 6.0);
    EXPECT_DOUBLE_EQ(position.premiumReceived(), 0.0);
    EXPECT_DOUBLE_EQ(position.netCost(), 6.0);
}

TEST(PositionTest, ShortCollectsPremium) {
    portfolio::Position position(makeOption(Side::SHORT, OptionStyle::PUT, 100.0, 2.0), 2.0, 0.5, 0.5);

    EXPECT_DOUBLE_EQ(position.totalCost(), 2.0);
    EXPECT_DOUBLE_EQ(position.premiumReceived(), 4.0);
    EXPECT_DOUBLE_EQ(position.netCost(), -2.0);
}

TEST(PositionTest, TheoreticalValueScalesWithQuantity) {
    const auto option = makeOption(Side::LONG, OptionStyle::CALL, 100.0, 3.0);
    portfolio::Position position(option, 1.0);

    const double unit = common::getValue(math::pricing::blackScholesPrice(option));
    EXPECT_NEAR(common::getValue(position.theoreticalValue()), 3.0 * unit, 1e-12);
}

TEST(PositionTest, ValidateChecksEconomicsThenContract) {
    portfolio::Position negativePremium(makeOption(Side::LONG, OptionStyle::CALL, 100.0), -1.0);
    EXPECT_EQ(common::getError(negativePremium.validate()).code, common::ErrorCode::INVALID_PRICE);

    portfolio::Position negativeQuantity(makeOption(Side::LONG, OptionStyle::CALL, 100.0, -1.0), 1.0);
    EXPECT_EQ(common::getError(negativeQuantity.validate()).code, common::ErrorCode::INVALID_QUANTITY);

    portfolio::Position negativeVol(makeOption(Side::LONG, OptionStyle::CALL, 100.0, 1.0, 100.0, -0.1), 1.0);
    EXPECT_EQ(common::getError(negativeVol.validate()).code, common::ErrorCode::INVALID_VOLATILITY);

    portfolio::Position good(makeOption(Side::SHORT, OptionStyle::PUT, 95.0), 1.5);
    EXPECT_TRUE(common::isSuccess(good.validate()));
}

TEST(PositionTest, MatchesExactLeg) {
    portfolio::Position position(makeOption(Side::SHORT, OptionStyle::CALL, 105.0), 1.0);

    EXPECT_TRUE(position.matches(105.0, OptionStyle::CALL, Side::SHORT));
    EXPECT_FALSE(position.matches(105.0, OptionStyle::CALL, Side::LONG));
    EXPECT_FALSE(position.matches(105.0, OptionStyle::PUT, Side::SHORT));
    EXPECT_FALSE(position.matches(105.5, OptionStyle::CALL, Side::SHORT));
}

TEST(PositionTest, OptionMoneyness) {
    EXPECT_TRUE(makeOption(Side::LONG, OptionStyle::CALL, 95.0).isInTheMoney());
    EXPECT_FALSE(makeOption(Side::LONG, OptionStyle::CALL, 105.0).isInTheMoney());
    EXPECT_TRUE(makeOption(Side::LONG, OptionStyle::PUT, 105.0).isInTheMoney());
    EXPECT_TRUE(makeOption(Side::LONG, OptionStyle::PUT, 100.0).isInTheMoney());
}

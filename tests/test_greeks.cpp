/*
 * Filename: test_greeks.cpp
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
#include "math/greeks/firstOrder.hpp"
#include "math/greeks/secondOrder.hpp"
#include "math/greeks/numerical.hpp"
#include "math/pricing/black_scholes.hpp"
#include <cmath>

using common::OptionStyle;
using common::Side;
using fixtures::makeOption;
using fixtures::textbookOption;

namespace {

double value(const common::Result<double>& result) {
    EXPECT_TRUE(common::isSuccess(result)) << common::getError(result).toString();
    return common::getValue(result);
}

}

TEST(GreeksTest, TextbookCall) {
    const auto call = textbookOption(OptionStyle::CALL);

    EXPECT_NEAR(value(math::greeks::delta(call)), 0.636831, 1e-5);
    EXPECT_NEAR(value(math::greeks::gamma(call)), 0.018762, 1e-5);
    EXPECT_NEAR(value(math::greeks::vega(call)), 37.524, 1e-3);
    EXPECT_NEAR(value(math::greeks::theta(call)), -6.414, 1e-3);
    EXPECT_NEAR(value(math::greeks::rho(call)), 53.2325, 1e-3);
    EXPECT_NEAR(value(math::pricing::blackScholesPrice(call)), 10.4506, 1e-3);
}

TEST(GreeksTest, CallMinusPutDeltaIsDividendDiscount) {
    const auto call = makeOption(Side::LONG, OptionStyle::CALL, 105.0);
    const auto put = makeOption(Side::LONG, OptionStyle::PUT, 105.0);
    const double T = call.timeToExpiration();

    EXPECT_NEAR(value(math::greeks::delta(call)) - value(math::greeks::delta(put)),
                std::exp(-fixtures::DIVIDEND * T), 1e-12);
}

TEST(GreeksTest, GammaAndVegaIgnoreStyle) {
    for (double strike : {90.0, 100.0, 112.5}) {
        const auto call = makeOption(Side::LONG, OptionStyle::CALL, strike);
        const auto put = makeOption(Side::LONG, OptionStyle::PUT, strike);
        EXPECT_DOUBLE_EQ(value(math::greeks::gamma(call)), value(math::greeks::gamma(put)));
        EXPECT_DOUBLE_EQ(value(math::greeks::vega(call)), value(math::greeks::vega(put)));
    }
}

TEST(GreeksTest, ShortSideFlipsDeltaOnly) {
    const auto longCall = makeOption(Side::LONG, OptionStyle::CALL, 100.0);
    const auto shortCall = makeOption(Side::SHORT, OptionStyle::CALL, 100.0);

    EXPECT_DOUBLE_EQ(value(math::greeks::delta(shortCall)), -value(math::greeks::delta(longCall)));
    EXPECT_DOUBLE_EQ(value(math::greeks::gamma(shortCall)), value(math::greeks::gamma(longCall)));
    EXPECT_DOUBLE_EQ(value(math::greeks::vega(shortCall)), value(math::greeks::vega(longCall)));
}

TEST(GreeksTest, QuantityScalesEveryGreek) {
    const auto one = makeOption(Side::LONG, OptionStyle::PUT, 98.0, 1.0);
    const auto three = makeOption(Side::LONG, OptionStyle::PUT, 98.0, 3.0);

    EXPECT_NEAR(value(math::greeks::delta(three)), 3.0 * value(math::greeks::delta(one)), 1e-12);
    EXPECT_NEAR(value(math::greeks::gamma(three)), 3.0 * value(math::greeks::gamma(one)), 1e-12);
    EXPECT_NEAR(value(math::greeks::theta(three)), 3.0 * value(math::greeks::theta(one)), 1e-10);
    EXPECT_NEAR(value(math::greeks::vega(three)), 3.0 * value(math::greeks::vega(one)), 1e-10);
    EXPECT_NEAR(value(math::greeks::rho(three)), 3.0 * value(math::greeks::rho(one)), 1e-10);
    EXPECT_NEAR(value(math::greeks::rhoD(three)), 3.0 * value(math::greeks::rhoD(one)), 1e-10);
}

TEST(GreeksTest, RhoSigns) {
    const auto call = makeOption(Side::LONG, OptionStyle::CALL, 100.0);
    const auto put = makeOption(Side::LONG, OptionStyle::PUT, 100.0);

    EXPECT_GT(value(math::greeks::rho(call)), 0.0);
    EXPECT_LT(value(math::greeks::rho(put)), 0.0);
    EXPECT_LT(value(math::greeks::rhoD(call)), 0.0);
    EXPECT_GT(value(math::greeks::rhoD(put)), 0.0);
}

TEST(GreeksTest, ZeroVolatilityDeltaFollowsMoneyness) {
    auto zeroVol = [](Side side, OptionStyle style, double strike, double quantity = 1.0) {
        return makeOption(side, style, strike, quantity, 100.0, 0.0);
    };

    EXPECT_DOUBLE_EQ(value(math::greeks::delta(zeroVol(Side::LONG, OptionStyle::CALL, 90.0))), 1.0);
    EXPECT_DOUBLE_EQ(value(math::greeks::delta(zeroVol(Side::LONG, OptionStyle::CALL, 100.0))), 1.0);
    EXPECT_DOUBLE_EQ(value(math::greeks::delta(zeroVol(Side::LONG, OptionStyle::CALL, 110.0))), 0.0);
    EXPECT_DOUBLE_EQ(value(math::greeks::delta(zeroVol(Side::LONG, OptionStyle::PUT, 100.0))), -1.0);
    EXPECT_DOUBLE_EQ(value(math::greeks::delta(zeroVol(Side::LONG, OptionStyle::PUT, 90.0))), 0.0);
    EXPECT_DOUBLE_EQ(value(math::greeks::delta(zeroVol(Side::SHORT, OptionStyle::PUT, 110.0))), 1.0);
    EXPECT_DOUBLE_EQ(value(math::greeks::delta(zeroVol(Side::SHORT, OptionStyle::CALL, 95.0, 2.0))), -2.0);
}

TEST(GreeksTest, ZeroVolatilityFailsOutsideDelta) {
    const auto option = makeOption(Side::LONG, OptionStyle::CALL, 100.0, 1.0, 100.0, 0.0);

    for (const auto& greek : {math::greeks::gamma, math::greeks::theta, math::greeks::vega,
                              math::greeks::rho, math::greeks::rhoD}) {
        auto result = greek(option);
        ASSERT_FALSE(common::isSuccess(result));
        EXPECT_EQ(common::getError(result).code, common::ErrorCode::INVALID_VOLATILITY);
    }
}

TEST(GreeksTest, InvalidContractPropagatesKernelError) {
    auto expired = makeOption(Side::LONG, OptionStyle::CALL, 100.0, 1.0, 100.0, 0.2, 0.0, 0.0);
    EXPECT_EQ(common::getError(math::greeks::delta(expired)).code, common::ErrorCode::INVALID_TIME);

    auto badStrike = makeOption(Side::LONG, OptionStyle::PUT, 0.0);
    EXPECT_EQ(common::getError(math::greeks::vega(badStrike)).code, common::ErrorCode::INVALID_STRIKE);
}

TEST(GreeksTest, AnalyticMatchesFiniteDifferences) {
    for (auto style : {OptionStyle::CALL, OptionStyle::PUT}) {
        for (double strike : {85.0, 100.0, 115.0}) {
            const auto option = makeOption(Side::LONG, style, strike, 1.0, 100.0, 0.25, 0.0, 90.0);

            EXPECT_NEAR(value(math::greeks::delta(option)),
                        value(math::greeks::numericalDelta(option)), 1e-4);
            EXPECT_NEAR(value(math::greeks::gamma(option)),
                        value(math::greeks::numericalGamma(option)), 1e-4);
            EXPECT_NEAR(value(math::greeks::vega(option)),
                        value(math::greeks::numericalVega(option)), 1e-3);
        }
    }
}

TEST(PricingTest, PutCallParity) {
    const auto call = makeOption(Side::LONG, OptionStyle::CALL, 104.0, 1.0, 100.0, 0.3, 0.0);
    const auto put = makeOption(Side::LONG, OptionStyle::PUT, 104.0, 1.0, 100.0, 0.3, 0.0);
    const double T = call.timeToExpiration();

    const double lhs = value(math::pricing::blackScholesPrice(call)) -
                       value(math::pricing::blackScholesPrice(put));
    EXPECT_NEAR(lhs, 100.0 - 104.0 * std::exp(-fixtures::RATE * T), 1e-10);
}

TEST(PricingTest, ZeroVolatilityIsDiscountedIntrinsic) {
    const auto call = makeOption(Side::LONG, OptionStyle::CALL, 90.0, 1.0, 100.0, 0.0, 0.0);
    const double T = call.timeToExpiration();

    EXPECT_NEAR(value(math::pricing::blackScholesPrice(call)),
                100.0 - 90.0 * std::exp(-fixtures::RATE * T), 1e-12);
    EXPECT_DOUBLE_EQ(math::pricing::intrinsicValue(call), 10.0);

    const auto put = makeOption(Side::LONG, OptionStyle::PUT, 90.0, 1.0, 100.0, 0.0, 0.0);
    EXPECT_DOUBLE_EQ(value(math::pricing::blackScholesPrice(put)), 0.0);
}

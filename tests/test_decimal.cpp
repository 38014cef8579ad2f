/*
 * Filename: test_decimal.cpp
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
#include "math/core/decimal.hpp"
#include <cmath>
#include <limits>

using namespace math::core;

TEST(DecimalTest, ToF64RejectsNaN) {
    auto result = decimal::toF64(std::numeric_limits<double>::quiet_NaN());
    ASSERT_FALSE(common::isSuccess(result));
    EXPECT_EQ(common::getError(result).code, common::ErrorCode::CONVERSION_ERROR);
}

TEST(DecimalTest, ToF64PassesInfinity) {
    auto result = decimal::toF64(std::numeric_limits<double>::infinity());
    ASSERT_TRUE(common::isSuccess(result));
    EXPECT_TRUE(std::isinf(common::getValue(result)));
}

TEST(DecimalTest, FromF64RejectsNonFinite) {
    EXPECT_FALSE(common::isSuccess(decimal::fromF64(std::numeric_limits<double>::infinity())));
    EXPECT_FALSE(common::isSuccess(decimal::fromF64(-std::numeric_limits<double>::infinity())));
    EXPECT_FALSE(common::isSuccess(decimal::fromF64(std::numeric_limits<double>::quiet_NaN())));

    auto ok = decimal::fromF64(1.25);
    ASSERT_TRUE(common::isSuccess(ok));
    EXPECT_DOUBLE_EQ(common::getValue(ok), 1.25);
}

TEST(DecimalTest, CheckedFunctionsFailOutsideDomain) {
    EXPECT_EQ(common::getError(decimal::ln(0.0)).code, common::ErrorCode::CONVERSION_ERROR);
    EXPECT_EQ(common::getError(decimal::sqrt(-1.0)).code, common::ErrorCode::CONVERSION_ERROR);
    EXPECT_EQ(common::getError(decimal::exp(1000.0)).code, common::ErrorCode::CONVERSION_ERROR);

    EXPECT_NEAR(common::getValue(decimal::exp(1.0)), std::exp(1.0), 1e-15);
    EXPECT_NEAR(common::getValue(decimal::ln(std::exp(2.0))), 2.0, 1e-12);
    EXPECT_DOUBLE_EQ(common::getValue(decimal::sqrt(16.0)), 4.0);
    EXPECT_DOUBLE_EQ(common::getValue(decimal::powTwo(-3.0)), 9.0);
}

TEST(DecimalTest, RoundingAndApproximateEquality) {
    EXPECT_DOUBLE_EQ(decimal::roundTo(1.23456, 2), 1.23);
    EXPECT_DOUBLE_EQ(decimal::roundTo(-0.5551, 3), -0.555);
    EXPECT_TRUE(decimal::approxEqual(1.0, 1.0 + 1e-10));
    EXPECT_FALSE(decimal::approxEqual(1.0, 1.001));
    EXPECT_TRUE(decimal::approxEqual(1.0, 1.001, 0.01));
}

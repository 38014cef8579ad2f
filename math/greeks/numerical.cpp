/*
 * Filename: numerical.cpp
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

#include "numerical.hpp"
#include "math/pricing/black_scholes.hpp"

namespace math::greeks {

namespace {

struct Bumped {
    double down;
    double base;
    double up;
};

template<typename Shift>
common::Result<Bumped> reprice(const common::Option& option, double bumpSize, Shift shift) {
    common::Option downOption = option;
    common::Option upOption = option;
    shift(downOption, -bumpSize);
    shift(upOption, bumpSize);

    auto down = pricing::blackScholesPrice(downOption);
    if (!common::isSuccess(down)) return common::getError(down);
    auto base = pricing::blackScholesPrice(option);
    if (!common::isSuccess(base)) return common::getError(base);
    auto up = pricing::blackScholesPrice(upOption);
    if (!common::isSuccess(up)) return common::getError(up);

    return Bumped{common::getValue(down), common::getValue(base), common::getValue(up)};
}

void shiftSpot(common::Option& option, double amount) {
    option.underlyingPrice += amount;
}

void shiftVolatility(common::Option& option, double amount) {
    option.impliedVolatility += amount;
}

}

common::Result<double> numericalDelta(const common::Option& option, double bumpSize) {
    auto prices = reprice(option, bumpSize, shiftSpot);
    if (!common::isSuccess(prices)) return common::getError(prices);
    const Bumped& p = common::getValue(prices);
    return (p.up - p.down) / (2.0 * bumpSize);
}

common::Result<double> numericalGamma(const common::Option& option, double bumpSize) {
    auto prices = reprice(option, bumpSize, shiftSpot);
    if (!common::isSuccess(prices)) return common::getError(prices);
    const Bumped& p = common::getValue(prices);
    return (p.up - 2.0 * p.base + p.down) / (bumpSize * bumpSize);
}

common::Result<double> numericalVega(const common::Option& option, double bumpSize) {
    auto prices = reprice(option, bumpSize, shiftVolatility);
    if (!common::isSuccess(prices)) return common::getError(prices);
    const Bumped& p = common::getValue(prices);
    return (p.up - p.down) / (2.0 * bumpSize);
}

}

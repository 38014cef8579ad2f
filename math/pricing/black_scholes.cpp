/*
 * Filename: black_scholes.cpp
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

#include "black_scholes.hpp"
#include "math/greeks/kernel.hpp"
#include <algorithm>
#include <cmath>

namespace math::pricing {

core::Real intrinsicValue(const common::Option& option) {
    if (option.isCall()) {
        return std::max(option.underlyingPrice - option.strikePrice, 0.0);
    }
    return std::max(option.strikePrice - option.underlyingPrice, 0.0);
}

common::Result<core::Real> blackScholesPrice(const common::Option& option) {
    const core::Real S = option.underlyingPrice;
    const core::Real K = option.strikePrice;
    const core::Real r = option.riskFreeRate;
    const core::Real q = option.dividendYield;
    const core::Real T = option.timeToExpiration();
    const core::Real v = option.impliedVolatility;

    const core::Real rateDiscount = std::exp(-r * T);
    const core::Real dividendDiscount = std::exp(-q * T);

    if (v == 0.0 && T > 0.0) {
        const core::Real forward = S * dividendDiscount - K * rateDiscount;
        return option.isCall() ? std::max(forward, 0.0) : std::max(-forward, 0.0);
    }

    auto d1Value = greeks::d1(S, K, r, T, v);
    if (!common::isSuccess(d1Value)) return d1Value;
    auto d2Value = greeks::d2(S, K, r, T, v);
    if (!common::isSuccess(d2Value)) return d2Value;

    const core::Real sign = option.isCall() ? 1.0 : -1.0;

    auto nd1 = greeks::normalCDF(sign * common::getValue(d1Value));
    if (!common::isSuccess(nd1)) return nd1;
    auto nd2 = greeks::normalCDF(sign * common::getValue(d2Value));
    if (!common::isSuccess(nd2)) return nd2;

    return sign * (S * dividendDiscount * common::getValue(nd1) -
                   K * rateDiscount * common::getValue(nd2));
}

}

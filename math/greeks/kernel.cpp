/*
 * Filename: kernel.cpp
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

#include "kernel.hpp"
#include "../core/decimal.hpp"
#include <boost/math/distributions/normal.hpp>
#include <cmath>
#include <sstream>

namespace math::greeks {

namespace {

common::Error inputError(common::ErrorCode code, const char* what, core::Real value) {
    std::ostringstream ss;
    ss << what << " (got " << value << ")";
    return common::Error(code, ss.str());
}

}

common::Result<core::Real> d1(core::Real spot, core::Real strike, core::Real riskFreeRate,
                              core::Real timeToExpiry, core::Real volatility) {
    if (!(spot > 0.0)) {
        return inputError(common::ErrorCode::INVALID_PRICE, "underlying price must be positive", spot);
    }
    if (!(strike > 0.0)) {
        return inputError(common::ErrorCode::INVALID_STRIKE, "strike price must be positive", strike);
    }
    if (!(volatility > 0.0)) {
        return inputError(common::ErrorCode::INVALID_VOLATILITY, "volatility must be positive", volatility);
    }
    if (!(timeToExpiry > 0.0)) {
        return inputError(common::ErrorCode::INVALID_TIME, "time to expiry must be positive", timeToExpiry);
    }
    if (!std::isfinite(riskFreeRate)) {
        return inputError(common::ErrorCode::INVALID_RATE, "risk-free rate must be finite", riskFreeRate);
    }

    const core::Real sqrtT = std::sqrt(timeToExpiry);
    const core::Real value = (std::log(spot / strike) +
                              (riskFreeRate + volatility * volatility / 2.0) * timeToExpiry) /
                             (volatility * sqrtT);
    return core::decimal::fromF64(value);
}

common::Result<core::Real> d2(core::Real spot, core::Real strike, core::Real riskFreeRate,
                              core::Real timeToExpiry, core::Real volatility) {
    auto d1Value = d1(spot, strike, riskFreeRate, timeToExpiry, volatility);
    if (!common::isSuccess(d1Value)) {
        return d1Value;
    }
    return common::getValue(d1Value) - volatility * std::sqrt(timeToExpiry);
}

core::Real normalPDF(core::Real x) {
    return core::INV_SQRT_2PI * std::exp(-x * x / 2.0);
}

common::Result<core::Real> normalCDF(core::Real x) {
    auto input = core::decimal::toF64(x);
    if (!common::isSuccess(input)) {
        return common::getError(input);
    }

    static const boost::math::normal_distribution<double> standardNormal(0.0, 1.0);
    const double value = common::getValue(input);
    if (std::isinf(value)) {
        return value > 0.0 ? 1.0 : 0.0;
    }
    return core::decimal::fromF64(boost::math::cdf(standardNormal, value));
}

}

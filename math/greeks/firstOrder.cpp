/*
 * Filename: firstOrder.cpp
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

#include "firstOrder.hpp"
#include "kernel.hpp"
#include <cmath>

namespace math::greeks {

namespace {

struct Inputs {
    core::Real S;
    core::Real K;
    core::Real r;
    core::Real T;
    core::Real v;
    core::Real q;
};

Inputs inputsOf(const common::Option& option) {
    return Inputs{option.underlyingPrice, option.strikePrice, option.riskFreeRate,
                  option.timeToExpiration(), option.impliedVolatility, option.dividendYield};
}

core::Real sideSign(const common::Option& option) {
    return option.isLong() ? 1.0 : -1.0;
}

// Volatility-free delta: the contract is either fully in the money or
// worthless to small moves in the underlying.
core::Real intrinsicDelta(const common::Option& option) {
    const core::Real sign = sideSign(option);
    if (option.isCall()) {
        return option.underlyingPrice >= option.strikePrice ? sign : 0.0;
    }
    return option.underlyingPrice <= option.strikePrice ? -sign : 0.0;
}

}

common::Result<double> delta(const common::Option& option) {
    if (option.impliedVolatility == 0.0) {
        return intrinsicDelta(option) * option.quantity;
    }

    const Inputs in = inputsOf(option);
    auto d1Value = d1(in.S, in.K, in.r, in.T, in.v);
    if (!common::isSuccess(d1Value)) return common::getError(d1Value);

    auto nd1 = normalCDF(common::getValue(d1Value));
    if (!common::isSuccess(nd1)) return common::getError(nd1);

    const core::Real dividendDiscount = std::exp(-in.q * in.T);
    const core::Real sign = sideSign(option);

    core::Real value;
    if (option.isCall()) {
        value = sign * common::getValue(nd1) * dividendDiscount;
    } else {
        value = sign * (common::getValue(nd1) - 1.0) * dividendDiscount;
    }
    return value * option.quantity;
}

common::Result<double> theta(const common::Option& option) {
    const Inputs in = inputsOf(option);
    auto d1Value = d1(in.S, in.K, in.r, in.T, in.v);
    if (!common::isSuccess(d1Value)) return common::getError(d1Value);
    auto d2Value = d2(in.S, in.K, in.r, in.T, in.v);
    if (!common::isSuccess(d2Value)) return common::getError(d2Value);

    const core::Real D1 = common::getValue(d1Value);
    const core::Real D2 = common::getValue(d2Value);
    const core::Real dividendDiscount = std::exp(-in.q * in.T);
    const core::Real rateDiscount = std::exp(-in.r * in.T);

    const core::Real commonTerm = -in.S * in.v * dividendDiscount * normalPDF(D1) /
                                  (2.0 * std::sqrt(in.T));

    core::Real value;
    if (option.isCall()) {
        auto nd1 = normalCDF(D1);
        if (!common::isSuccess(nd1)) return common::getError(nd1);
        auto nd2 = normalCDF(D2);
        if (!common::isSuccess(nd2)) return common::getError(nd2);

        value = commonTerm
              - in.r * in.K * rateDiscount * common::getValue(nd2)
              + in.q * in.S * dividendDiscount * common::getValue(nd1);
    } else {
        auto nMinusD1 = normalCDF(-D1);
        if (!common::isSuccess(nMinusD1)) return common::getError(nMinusD1);
        auto nMinusD2 = normalCDF(-D2);
        if (!common::isSuccess(nMinusD2)) return common::getError(nMinusD2);

        value = commonTerm
              + in.r * in.K * rateDiscount * common::getValue(nMinusD2)
              - in.q * in.S * dividendDiscount * common::getValue(nMinusD1);
    }
    return value * option.quantity;
}

common::Result<double> vega(const common::Option& option) {
    const Inputs in = inputsOf(option);
    auto d1Value = d1(in.S, in.K, in.r, in.T, in.v);
    if (!common::isSuccess(d1Value)) return common::getError(d1Value);

    const core::Real value = in.S * std::exp(-in.q * in.T) *
                             normalPDF(common::getValue(d1Value)) * std::sqrt(in.T);
    return value * option.quantity;
}

common::Result<double> rho(const common::Option& option) {
    const Inputs in = inputsOf(option);
    auto d2Value = d2(in.S, in.K, in.r, in.T, in.v);
    if (!common::isSuccess(d2Value)) return common::getError(d2Value);

    const core::Real rateDiscount = std::exp(-in.r * in.T);
    const core::Real D2 = common::getValue(d2Value);

    core::Real value;
    if (option.isCall()) {
        auto nd2 = normalCDF(D2);
        if (!common::isSuccess(nd2)) return common::getError(nd2);
        value = in.K * in.T * rateDiscount * common::getValue(nd2);
    } else {
        auto nMinusD2 = normalCDF(-D2);
        if (!common::isSuccess(nMinusD2)) return common::getError(nMinusD2);
        value = -in.K * in.T * rateDiscount * common::getValue(nMinusD2);
    }
    return value * option.quantity;
}

common::Result<double> rhoD(const common::Option& option) {
    const Inputs in = inputsOf(option);
    auto d1Value = d1(in.S, in.K, in.r, in.T, in.v);
    if (!common::isSuccess(d1Value)) return common::getError(d1Value);

    const core::Real dividendDiscount = std::exp(-in.q * in.T);
    const core::Real D1 = common::getValue(d1Value);

    core::Real value;
    if (option.isCall()) {
        auto nd1 = normalCDF(D1);
        if (!common::isSuccess(nd1)) return common::getError(nd1);
        value = -in.T * in.S * dividendDiscount * common::getValue(nd1);
    } else {
        auto nMinusD1 = normalCDF(-D1);
        if (!common::isSuccess(nMinusD1)) return common::getError(nMinusD1);
        value = in.T * in.S * dividendDiscount * common::getValue(nMinusD1);
    }
    return value * option.quantity;
}

}

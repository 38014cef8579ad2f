/*
 * Filename: secondOrder.cpp
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

#include "secondOrder.hpp"
#include "kernel.hpp"
#include <cmath>

namespace math::greeks {

common::Result<double> gamma(const common::Option& option) {
    const core::Real S = option.underlyingPrice;
    const core::Real T = option.timeToExpiration();
    const core::Real v = option.impliedVolatility;

    auto d1Value = d1(S, option.strikePrice, option.riskFreeRate, T, v);
    if (!common::isSuccess(d1Value)) return common::getError(d1Value);

    const core::Real value = std::exp(-option.dividendYield * T) * normalPDF(common::getValue(d1Value)) /
                             (S * v * std::sqrt(T));
    return value * option.quantity;
}

}

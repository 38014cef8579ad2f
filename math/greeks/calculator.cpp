/*
 * Filename: calculator.cpp
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

#include "calculator.hpp"
#include "firstOrder.hpp"
#include "secondOrder.hpp"
#include "interfaces/greeks.hpp"

namespace math::greeks {

common::Result<common::Greeks> calculate(const common::Option& option) {
    common::Greeks greeks;

    const std::pair<GreekFunction, double*> fields[] = {
        {delta, &greeks.delta},
        {gamma, &greeks.gamma},
        {theta, &greeks.theta},
        {vega, &greeks.vega},
        {rho, &greeks.rho},
        {rhoD, &greeks.rhoD},
    };

    for (const auto& [function, target] : fields) {
        auto value = function(option);
        if (!common::isSuccess(value)) {
            return common::getError(value);
        }
        *target = common::getValue(value);
    }
    return greeks;
}

common::Result<double> sum(const std::vector<common::Option>& options, const GreekFunction& greek) {
    double total = 0.0;
    for (const auto& option : options) {
        auto value = greek(option);
        if (!common::isSuccess(value)) {
            return value;
        }
        total += common::getValue(value);
    }
    return total;
}

common::Result<common::Greeks> aggregate(const std::vector<common::Option>& options) {
    common::Greeks total;
    for (const auto& option : options) {
        auto greeks = calculate(option);
        if (!common::isSuccess(greeks)) {
            return greeks;
        }
        total += common::getValue(greeks);
    }
    total.alpha = alphaOf(total.gamma, total.theta);
    return total;
}

double alphaOf(double gamma, double theta) {
    if (theta == 0.0) {
        return 0.0;
    }
    return gamma / theta;
}

namespace {

common::Result<double> sumOver(const IGreeks& entity, const GreekFunction& greek) {
    auto options = entity.getOptions();
    if (!common::isSuccess(options)) {
        return common::getError(options);
    }
    return sum(common::getValue(options), greek);
}

}

common::Result<common::Greeks> IGreeks::greeks() const {
    auto options = getOptions();
    if (!common::isSuccess(options)) {
        return common::getError(options);
    }
    return aggregate(common::getValue(options));
}

common::Result<double> IGreeks::delta() const {
    return sumOver(*this, ::math::greeks::delta);
}

common::Result<double> IGreeks::gamma() const {
    return sumOver(*this, ::math::greeks::gamma);
}

common::Result<double> IGreeks::theta() const {
    return sumOver(*this, ::math::greeks::theta);
}

common::Result<double> IGreeks::vega() const {
    return sumOver(*this, ::math::greeks::vega);
}

common::Result<double> IGreeks::rho() const {
    return sumOver(*this, ::math::greeks::rho);
}

common::Result<double> IGreeks::rhoD() const {
    return sumOver(*this, ::math::greeks::rhoD);
}

common::Result<double> IGreeks::alpha() const {
    auto options = getOptions();
    if (!common::isSuccess(options)) {
        return common::getError(options);
    }
    auto totalGamma = sum(common::getValue(options), ::math::greeks::gamma);
    if (!common::isSuccess(totalGamma)) return totalGamma;
    auto totalTheta = sum(common::getValue(options), ::math::greeks::theta);
    if (!common::isSuccess(totalTheta)) return totalTheta;

    return alphaOf(common::getValue(totalGamma), common::getValue(totalTheta));
}

}

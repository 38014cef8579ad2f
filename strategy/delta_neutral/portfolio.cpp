/*
 * Filename: portfolio.cpp
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

#include "strategy/delta_neutral/portfolio.hpp"
#include <cmath>
#include <iomanip>

namespace strategy {

namespace {

PortfolioGreeks signedGreeks(const common::Greeks& greeks, common::Side side) {
    const double sign = side == common::Side::LONG ? 1.0 : -1.0;
    return PortfolioGreeks(greeks.delta, sign * greeks.gamma, sign * greeks.theta,
                           sign * greeks.vega, sign * greeks.rho);
}

bool within(const std::optional<double>& target, double value, double tolerance) {
    return !target || std::abs(value - *target) <= tolerance;
}

std::optional<double> gap(const std::optional<double>& target, double value) {
    if (!target) {
        return std::nullopt;
    }
    return *target - value;
}

}

common::Result<PortfolioGreeks> PortfolioGreeks::fromPositions(
    const std::vector<const portfolio::Position*>& positions, double underlyingQuantity) {
    PortfolioGreeks total;
    for (const portfolio::Position* position : positions) {
        auto greeks = position->greeks();
        if (!common::isSuccess(greeks)) {
            return common::getError(greeks);
        }
        total.add(signedGreeks(common::getValue(greeks), position->getOption().side));
    }
    total.delta += underlyingQuantity;
    return total;
}

common::Result<PortfolioGreeks> PortfolioGreeks::perContract(const portfolio::Position& position) {
    common::Option contract = position.getOption();
    contract.quantity = 1.0;
    auto greeks = contract.greeks();
    if (!common::isSuccess(greeks)) {
        return common::getError(greeks);
    }
    return signedGreeks(common::getValue(greeks), contract.side);
}

bool PortfolioGreeks::isDeltaNeutral(double tolerance) const {
    return std::abs(delta) <= tolerance;
}

bool PortfolioGreeks::isGammaNeutral(double tolerance) const {
    return std::abs(gamma) <= tolerance;
}

bool PortfolioGreeks::isVegaNeutral(double tolerance) const {
    return std::abs(vega) <= tolerance;
}

void PortfolioGreeks::add(const PortfolioGreeks& other) {
    delta += other.delta;
    gamma += other.gamma;
    theta += other.theta;
    vega += other.vega;
    rho += other.rho;
}

PortfolioGreeks PortfolioGreeks::combined(const PortfolioGreeks& other) const {
    PortfolioGreeks result = *this;
    result.add(other);
    return result;
}

std::ostream& operator<<(std::ostream& os, const PortfolioGreeks& greeks) {
    const auto flags = os.flags();
    const auto precision = os.precision();
    os << std::fixed << "Portfolio Greeks:\n"
       << "  Delta: " << std::setprecision(4) << greeks.delta << "\n"
       << "  Gamma: " << std::setprecision(6) << greeks.gamma << "\n"
       << "  Theta: " << std::setprecision(4) << greeks.theta << "\n"
       << "  Vega:  " << greeks.vega << "\n"
       << "  Rho:   " << greeks.rho << "\n";
    os.flags(flags);
    os.precision(precision);
    return os;
}

AdjustmentTarget AdjustmentTarget::deltaNeutral() {
    AdjustmentTarget target;
    target.delta = 0.0;
    return target;
}

AdjustmentTarget AdjustmentTarget::deltaGammaNeutral() {
    AdjustmentTarget target = deltaNeutral();
    target.gamma = 0.0;
    return target;
}

AdjustmentTarget AdjustmentTarget::fullNeutral() {
    AdjustmentTarget target = deltaGammaNeutral();
    target.vega = 0.0;
    return target;
}

double AdjustmentTarget::deltaGap(const PortfolioGreeks& current) const {
    return delta ? *delta - current.delta : 0.0;
}

std::optional<double> AdjustmentTarget::gammaGap(const PortfolioGreeks& current) const {
    return gap(gamma, current.gamma);
}

std::optional<double> AdjustmentTarget::vegaGap(const PortfolioGreeks& current) const {
    return gap(vega, current.vega);
}

std::optional<double> AdjustmentTarget::thetaGap(const PortfolioGreeks& current) const {
    return gap(theta, current.theta);
}

bool AdjustmentTarget::isSatisfied(const PortfolioGreeks& current, double tolerance) const {
    return within(delta, current.delta, tolerance) && within(gamma, current.gamma, tolerance) &&
           within(vega, current.vega, tolerance) && within(theta, current.theta, tolerance);
}

std::ostream& operator<<(std::ostream& os, const AdjustmentTarget& target) {
    const auto flags = os.flags();
    const auto precision = os.precision();
    os << std::fixed << "Adjustment Target:\n";
    if (target.delta) {
        os << "  Delta: " << std::setprecision(4) << *target.delta << "\n";
    }
    if (target.gamma) {
        os << "  Gamma: " << std::setprecision(6) << *target.gamma << "\n";
    }
    if (target.vega) {
        os << "  Vega:  " << std::setprecision(4) << *target.vega << "\n";
    }
    if (target.theta) {
        os << "  Theta: " << std::setprecision(4) << *target.theta << "\n";
    }
    os.flags(flags);
    os.precision(precision);
    return os;
}

}

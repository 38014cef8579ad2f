/*
 * Filename: portfolio.hpp
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

#pragma once

#include "portfolio/position.hpp"
#include "common/result.hpp"
#include <optional>
#include <ostream>
#include <vector>

namespace strategy {

// Position-weighted Greeks of a set of legs plus any shares held. Short legs
// contribute negative gamma, theta, vega and rho; delta is signed per leg.
struct PortfolioGreeks {
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;
    double vega = 0.0;
    double rho = 0.0;

    PortfolioGreeks() = default;
    PortfolioGreeks(double d, double g, double t, double v, double r)
        : delta(d), gamma(g), theta(t), vega(v), rho(r) {}

    static common::Result<PortfolioGreeks> fromPositions(
        const std::vector<const portfolio::Position*>& positions, double underlyingQuantity = 0.0);

    // Greeks of a single contract of the leg, signed by its side.
    static common::Result<PortfolioGreeks> perContract(const portfolio::Position& position);

    bool isDeltaNeutral(double tolerance) const;
    bool isGammaNeutral(double tolerance) const;
    bool isVegaNeutral(double tolerance) const;

    double deltaGap(double target = 0.0) const { return target - delta; }
    double gammaGap(double target = 0.0) const { return target - gamma; }

    void add(const PortfolioGreeks& other);
    PortfolioGreeks combined(const PortfolioGreeks& other) const;
};

std::ostream& operator<<(std::ostream& os, const PortfolioGreeks& greeks);

// The Greek levels an adjustment should reach. Unset fields are unconstrained.
struct AdjustmentTarget {
    std::optional<double> delta;
    std::optional<double> gamma;
    std::optional<double> vega;
    std::optional<double> theta;

    static AdjustmentTarget deltaNeutral();
    static AdjustmentTarget deltaGammaNeutral();
    static AdjustmentTarget fullNeutral();

    // Zero when delta is unconstrained.
    double deltaGap(const PortfolioGreeks& current) const;
    std::optional<double> gammaGap(const PortfolioGreeks& current) const;
    std::optional<double> vegaGap(const PortfolioGreeks& current) const;
    std::optional<double> thetaGap(const PortfolioGreeks& current) const;

    bool constrainsOnlyDelta() const { return !gamma && !vega && !theta; }
    bool isSatisfied(const PortfolioGreeks& current, double tolerance) const;
};

std::ostream& operator<<(std::ostream& os, const AdjustmentTarget& target);

}

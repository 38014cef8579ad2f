/*
 * Filename: optimizer.hpp
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

#include "strategy/delta_neutral/adjustment.hpp"
#include "strategy/delta_neutral/portfolio.hpp"
#include "portfolio/position.hpp"
#include "common/result.hpp"
#include <cstddef>
#include <vector>

namespace strategy {

// Searches for the cheapest way to reach an AdjustmentTarget by resizing the
// legs already held or, for delta-only targets, by trading the underlying.
// Each targeted Greek needs one leg, so a delta-gamma target resizes two legs.
class AdjustmentOptimizer {
private:
    std::vector<const portfolio::Position*> positions_;
    double underlyingPrice_;
    AdjustmentConfig config_;
    AdjustmentTarget target_;

public:
    AdjustmentOptimizer(std::vector<const portfolio::Position*> positions, double underlyingPrice,
                        AdjustmentConfig config = AdjustmentConfig(),
                        AdjustmentTarget target = AdjustmentTarget::deltaNeutral());

    // Fails with RETRIEVAL_ERROR without positions, NO_VIABLE_PLAN when no
    // combination reaches the target and COST_EXCEEDED when every plan that
    // does is over config.maxCost.
    common::Result<AdjustmentPlan> optimize() const;

    common::Result<double> estimateCost(const std::vector<AdjustmentAction>& actions) const;

private:
    struct Candidate {
        std::size_t index;
        PortfolioGreeks unit;
    };

    common::Result<AdjustmentPlan> optimizeExistingLegs(const PortfolioGreeks& current,
                                                        bool& costExceeded) const;
    common::Result<AdjustmentPlan> optimizeWithUnderlying(const PortfolioGreeks& current) const;
    common::Result<AdjustmentPlan> buildPlan(std::vector<AdjustmentAction> actions) const;

    std::vector<double> targetGaps(const PortfolioGreeks& current) const;
    std::vector<double> targetedValues(const PortfolioGreeks& greeks) const;
};

}

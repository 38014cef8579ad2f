/*
 * Filename: neutrality.hpp
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

#include "strategy/delta_neutral/model.hpp"
#include "strategy/delta_neutral/optimizer.hpp"
#include "interfaces/greeks.hpp"
#include "interfaces/positionable.hpp"
#include "interfaces/strategy.hpp"
#include "common/result.hpp"
#include "common/types.hpp"
#include <optional>
#include <vector>

namespace strategy {

// Evaluates a strategy's net delta and proposes or applies the trades that
// bring it back inside the neutrality threshold.
class DeltaNeutrality : public math::greeks::IGreeks, public IPositionable, public IStrategy {
public:
    ~DeltaNeutrality() override = default;

    common::Result<DeltaInfo> deltaNeutrality(double threshold = DELTA_THRESHOLD) const;

    // A Greeks failure counts as not neutral.
    bool isDeltaNeutral(double threshold = DELTA_THRESHOLD) const;

    // Every entry is an independent plan that neutralizes the strategy on
    // its own; they are not meant to be applied together.
    common::Result<std::vector<DeltaAdjustment>> deltaAdjustments(
        double threshold = DELTA_THRESHOLD) const;

    // Applies the proposed plans in order until the strategy is neutral.
    // BUY keeps only BuyOptions, SELL only SellOptions, no action keeps all.
    // A failed plan is recorded and the next one is tried.
    common::Result<AdjustmentReport> applyDeltaAdjustments(
        std::optional<common::Action> action, double threshold = DELTA_THRESHOLD);

    common::Result<bool> applySingleAdjustment(const DeltaAdjustment& adjustment);

    common::Result<bool> adjustOptionPosition(double quantityDelta, double strike,
                                              common::OptionStyle style, common::Side side);

    // Signed Greeks of every leg; no underlying is included.
    common::Result<PortfolioGreeks> portfolioGreeks() const;

    common::Result<AdjustmentPlan> optimizeAdjustments(
        const AdjustmentTarget& target = AdjustmentTarget::deltaNeutral(),
        const AdjustmentConfig& config = AdjustmentConfig()) const;

    // Validates every action before applying any of them.
    common::Result<bool> applyAdjustmentPlan(const AdjustmentPlan& plan);

    // No underlying is held by default; strategies that carry shares override this.
    virtual common::Result<bool> adjustUnderlyingPosition(double quantityDelta);

private:
    common::Result<bool> applyAdjustment(const DeltaAdjustment& adjustment, bool nested);
    common::Result<bool> checkResolvable(const DeltaAdjustment& adjustment);
};

}

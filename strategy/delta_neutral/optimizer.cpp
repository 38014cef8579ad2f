/*
 * Filename: optimizer.cpp
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

#include "strategy/delta_neutral/optimizer.hpp"
#include "math/pricing/black_scholes.hpp"
#include "math/core/types.hpp"
#include "core/logger.hpp"
#include <cmath>
#include <optional>
#include <string>
#include <utility>

namespace strategy {

using math::core::TOLERANCE;

namespace {

constexpr double SINGULAR_PIVOT = 1e-12;

// Gaussian elimination with partial pivoting; false when the system is singular.
bool solve(std::vector<std::vector<double>> a, std::vector<double> b, std::vector<double>& x) {
    const std::size_t n = b.size();
    for (std::size_t col = 0; col < n; ++col) {
        std::size_t pivot = col;
        for (std::size_t row = col + 1; row < n; ++row) {
            if (std::abs(a[row][col]) > std::abs(a[pivot][col])) {
                pivot = row;
            }
        }
        if (std::abs(a[pivot][col]) < SINGULAR_PIVOT) {
            return false;
        }
        std::swap(a[col], a[pivot]);
        std::swap(b[col], b[pivot]);

        for (std::size_t row = col + 1; row < n; ++row) {
            const double factor = a[row][col] / a[col][col];
            for (std::size_t k = col; k < n; ++k) {
                a[row][k] -= factor * a[col][k];
            }
            b[row] -= factor * b[col];
        }
    }

    x.assign(n, 0.0);
    for (std::size_t i = n; i-- > 0;) {
        double sum = b[i];
        for (std::size_t k = i + 1; k < n; ++k) {
            sum -= a[i][k] * x[k];
        }
        x[i] = sum / a[i][i];
    }
    return true;
}

// Advances a sorted k-subset of {0..n-1}; false after the last one.
bool nextCombination(std::vector<std::size_t>& picks, std::size_t n) {
    const std::size_t k = picks.size();
    for (std::size_t i = k; i-- > 0;) {
        if (picks[i] < n - k + i) {
            ++picks[i];
            for (std::size_t j = i + 1; j < k; ++j) {
                picks[j] = picks[j - 1] + 1;
            }
            return true;
        }
    }
    return false;
}

}

AdjustmentOptimizer::AdjustmentOptimizer(std::vector<const portfolio::Position*> positions,
                                         double underlyingPrice, AdjustmentConfig config,
                                         AdjustmentTarget target)
    : positions_(std::move(positions)),
      underlyingPrice_(underlyingPrice),
      config_(std::move(config)),
      target_(std::move(target)) {}

common::Result<AdjustmentPlan> AdjustmentOptimizer::optimize() const {
    if (positions_.empty()) {
        return common::makeError<AdjustmentPlan>(common::ErrorCode::RETRIEVAL_ERROR,
                                                 "no positions to adjust");
    }

    auto greeks = PortfolioGreeks::fromPositions(positions_);
    if (!common::isSuccess(greeks)) {
        return common::getError(greeks);
    }
    const PortfolioGreeks& current = common::getValue(greeks);

    if (target_.isSatisfied(current, config_.deltaTolerance)) {
        core::Logger::getInstance().debug("already at target, no adjustment needed");
        return AdjustmentPlan({}, 0.0, current, -target_.deltaGap(current));
    }

    std::optional<AdjustmentPlan> best;
    bool costExceeded = false;

    if (config_.preferExistingLegs) {
        auto plan = optimizeExistingLegs(current, costExceeded);
        if (common::isSuccess(plan)) {
            best = common::getValue(plan);
        } else if (common::getError(plan).code != common::ErrorCode::NO_VIABLE_PLAN) {
            return common::getError(plan);
        }
    }

    if (config_.allowUnderlying && target_.constrainsOnlyDelta()) {
        auto plan = optimizeWithUnderlying(current);
        if (common::isSuccess(plan)) {
            const auto& candidate = common::getValue(plan);
            if (!best || candidate.qualityScore < best->qualityScore) {
                best = candidate;
            }
        } else if (common::getError(plan).code == common::ErrorCode::COST_EXCEEDED) {
            costExceeded = true;
        } else {
            return common::getError(plan);
        }
    }

    if (best) {
        core::Logger::getInstance().debug("selected plan with ", best->actionCount(),
                                          " action(s), quality ", best->qualityScore);
        return *best;
    }
    if (costExceeded) {
        return common::makeError<AdjustmentPlan>(common::ErrorCode::COST_EXCEEDED,
                                                 "every adjustment plan exceeds the maximum cost");
    }
    return common::makeError<AdjustmentPlan>(common::ErrorCode::NO_VIABLE_PLAN,
                                             "no viable adjustment plan found");
}

common::Result<AdjustmentPlan> AdjustmentOptimizer::optimizeExistingLegs(const PortfolioGreeks& current,
                                                                         bool& costExceeded) const {
    const std::vector<double> gaps = targetGaps(current);

    std::vector<Candidate> candidates;
    for (std::size_t i = 0; i < positions_.size(); ++i) {
        if (!config_.allowsLeg(*positions_[i])) {
            continue;
        }
        // Legs whose Greeks cannot be computed are not candidates.
        auto unit = PortfolioGreeks::perContract(*positions_[i]);
        if (!common::isSuccess(unit)) {
            core::Logger::getInstance().debug("leg ", i, " skipped: ", common::getError(unit).toString());
            continue;
        }
        candidates.push_back(Candidate{i, common::getValue(unit)});
    }

    const std::size_t needed = gaps.size();
    if (needed == 0 || candidates.size() < needed) {
        return common::makeError<AdjustmentPlan>(common::ErrorCode::NO_VIABLE_PLAN,
                                                 "not enough adjustable legs for the target");
    }

    std::optional<AdjustmentPlan> best;
    std::vector<std::size_t> picks(needed);
    for (std::size_t i = 0; i < needed; ++i) {
        picks[i] = i;
    }

    do {
        std::vector<std::vector<double>> matrix(needed, std::vector<double>(needed, 0.0));
        for (std::size_t col = 0; col < needed; ++col) {
            const std::vector<double> unit = targetedValues(candidates[picks[col]].unit);
            for (std::size_t row = 0; row < needed; ++row) {
                matrix[row][col] = unit[row];
            }
        }

        std::vector<double> changes;
        if (!solve(matrix, gaps, changes)) {
            continue;
        }

        std::vector<AdjustmentAction> actions;
        bool feasible = true;
        for (std::size_t col = 0; col < needed && feasible; ++col) {
            const std::size_t index = candidates[picks[col]].index;
            const double newQuantity = positions_[index]->getQuantity() + changes[col];
            if (newQuantity < -TOLERANCE) {
                feasible = false;
            } else if (std::abs(changes[col]) < TOLERANCE) {
                continue;
            } else if (newQuantity <= TOLERANCE) {
                actions.push_back(AdjustmentAction::closeLeg(index));
            } else {
                actions.push_back(AdjustmentAction::modifyQuantity(index, newQuantity));
            }
        }
        if (!feasible || actions.empty()) {
            continue;
        }

        auto plan = buildPlan(std::move(actions));
        if (!common::isSuccess(plan)) {
            if (common::getError(plan).code == common::ErrorCode::COST_EXCEEDED) {
                costExceeded = true;
                continue;
            }
            return common::getError(plan);
        }
        const auto& candidate = common::getValue(plan);
        if (!best || candidate.qualityScore < best->qualityScore) {
            best = candidate;
        }
    } while (nextCombination(picks, candidates.size()));

    if (!best) {
        return common::makeError<AdjustmentPlan>(common::ErrorCode::NO_VIABLE_PLAN,
                                                 "no combination of existing legs reaches the target");
    }
    return *best;
}

common::Result<AdjustmentPlan> AdjustmentOptimizer::optimizeWithUnderlying(const PortfolioGreeks& current) const {
    return buildPlan({AdjustmentAction::addUnderlying(target_.deltaGap(current))});
}

common::Result<AdjustmentPlan> AdjustmentOptimizer::buildPlan(std::vector<AdjustmentAction> actions) const {
    auto cost = estimateCost(actions);
    if (!common::isSuccess(cost)) {
        return common::getError(cost);
    }
    const double estimated = common::getValue(cost);
    if (config_.maxCost && estimated > *config_.maxCost) {
        return common::makeError<AdjustmentPlan>(common::ErrorCode::COST_EXCEEDED,
                                                 "adjustment cost exceeds maximum");
    }

    std::vector<portfolio::Position> preview;
    preview.reserve(positions_.size());
    for (const portfolio::Position* position : positions_) {
        preview.push_back(*position);
    }

    double shares = 0.0;
    for (const auto& action : actions) {
        if (action.is<ModifyQuantity>()) {
            const auto& modify = action.as<ModifyQuantity>();
            preview[modify.legIndex].setQuantity(modify.newQuantity);
        } else if (action.is<CloseLeg>()) {
            preview[action.as<CloseLeg>().legIndex].setQuantity(0.0);
        } else {
            shares += action.as<AddUnderlying>().quantity;
        }
    }

    std::vector<const portfolio::Position*> legs;
    legs.reserve(preview.size());
    for (const auto& position : preview) {
        legs.push_back(&position);
    }
    auto resulting = PortfolioGreeks::fromPositions(legs, shares);
    if (!common::isSuccess(resulting)) {
        return common::getError(resulting);
    }

    const PortfolioGreeks& greeks = common::getValue(resulting);
    return AdjustmentPlan(std::move(actions), estimated, greeks, -target_.deltaGap(greeks));
}

// Option trades cost their Black-Scholes value per contract traded; shares
// cost the spot price.
common::Result<double> AdjustmentOptimizer::estimateCost(const std::vector<AdjustmentAction>& actions) const {
    double cost = 0.0;
    for (const auto& action : actions) {
        if (action.is<AddUnderlying>()) {
            cost += std::abs(underlyingPrice_ * action.as<AddUnderlying>().quantity);
            continue;
        }

        const std::size_t index = action.is<ModifyQuantity>() ? action.as<ModifyQuantity>().legIndex
                                                              : action.as<CloseLeg>().legIndex;
        if (index >= positions_.size()) {
            return common::makeError<double>(common::ErrorCode::INVALID_ADJUSTMENT,
                                             "leg index " + std::to_string(index) + " is out of range");
        }
        const portfolio::Position& position = *positions_[index];
        const double traded = action.is<ModifyQuantity>()
                                  ? std::abs(action.as<ModifyQuantity>().newQuantity - position.getQuantity())
                                  : position.getQuantity();

        auto price = math::pricing::blackScholesPrice(position.getOption());
        if (!common::isSuccess(price)) {
            return common::getError(price);
        }
        cost += common::getValue(price) * traded;
    }
    return cost;
}

std::vector<double> AdjustmentOptimizer::targetGaps(const PortfolioGreeks& current) const {
    std::vector<double> gaps;
    if (target_.delta) {
        gaps.push_back(target_.deltaGap(current));
    }
    if (auto gap = target_.gammaGap(current)) {
        gaps.push_back(*gap);
    }
    if (auto gap = target_.vegaGap(current)) {
        gaps.push_back(*gap);
    }
    if (auto gap = target_.thetaGap(current)) {
        gaps.push_back(*gap);
    }
    return gaps;
}

std::vector<double> AdjustmentOptimizer::targetedValues(const PortfolioGreeks& greeks) const {
    std::vector<double> values;
    if (target_.delta) {
        values.push_back(greeks.delta);
    }
    if (target_.gamma) {
        values.push_back(greeks.gamma);
    }
    if (target_.vega) {
        values.push_back(greeks.vega);
    }
    if (target_.theta) {
        values.push_back(greeks.theta);
    }
    return values;
}

}

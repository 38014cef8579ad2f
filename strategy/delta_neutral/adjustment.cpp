/*
 * Filename: adjustment.cpp
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

#include "strategy/delta_neutral/adjustment.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>

namespace strategy {

AdjustmentAction AdjustmentAction::modifyQuantity(std::size_t legIndex, double newQuantity) {
    return AdjustmentAction(ModifyQuantity{legIndex, newQuantity});
}

AdjustmentAction AdjustmentAction::closeLeg(std::size_t legIndex) {
    return AdjustmentAction(CloseLeg{legIndex});
}

AdjustmentAction AdjustmentAction::addUnderlying(double quantity) {
    return AdjustmentAction(AddUnderlying{quantity});
}

bool AdjustmentAction::operator==(const AdjustmentAction& other) const {
    if (value_.index() != other.value_.index()) {
        return false;
    }
    if (is<ModifyQuantity>()) {
        const auto& lhs = as<ModifyQuantity>();
        const auto& rhs = other.as<ModifyQuantity>();
        return lhs.legIndex == rhs.legIndex && lhs.newQuantity == rhs.newQuantity;
    }
    if (is<CloseLeg>()) {
        return as<CloseLeg>().legIndex == other.as<CloseLeg>().legIndex;
    }
    return as<AddUnderlying>().quantity == other.as<AddUnderlying>().quantity;
}

std::ostream& operator<<(std::ostream& os, const AdjustmentAction& action) {
    if (action.is<ModifyQuantity>()) {
        const auto& modify = action.as<ModifyQuantity>();
        os << "Modify leg " << modify.legIndex << " to quantity " << modify.newQuantity;
    } else if (action.is<CloseLeg>()) {
        os << "Close leg " << action.as<CloseLeg>().legIndex;
    } else {
        const double quantity = action.as<AddUnderlying>().quantity;
        os << (quantity >= 0.0 ? "Buy " : "Sell ") << std::abs(quantity) << " shares of underlying";
    }
    return os;
}

AdjustmentConfig AdjustmentConfig::existingLegsOnly() {
    AdjustmentConfig config;
    config.allowUnderlying = false;
    config.preferExistingLegs = true;
    return config;
}

AdjustmentConfig AdjustmentConfig::withUnderlying() {
    AdjustmentConfig config;
    config.allowUnderlying = true;
    return config;
}

bool AdjustmentConfig::allowsLeg(const portfolio::Position& position) const {
    const auto& option = position.getOption();
    if (std::find(allowedStyles.begin(), allowedStyles.end(), option.optionStyle) ==
        allowedStyles.end()) {
        return false;
    }
    if (strikeRange) {
        return option.strikePrice >= strikeRange->first && option.strikePrice <= strikeRange->second;
    }
    return true;
}

AdjustmentPlan::AdjustmentPlan(std::vector<AdjustmentAction> actions, double estimatedCost,
                               const PortfolioGreeks& resultingGreeks, double residualDelta)
    : actions(std::move(actions)),
      estimatedCost(estimatedCost),
      resultingGreeks(resultingGreeks),
      residualDelta(residualDelta),
      qualityScore(std::abs(residualDelta) + estimatedCost * 0.01) {}

bool AdjustmentPlan::isDeltaNeutral(double tolerance) const {
    return std::abs(residualDelta) <= tolerance;
}

std::ostream& operator<<(std::ostream& os, const AdjustmentPlan& plan) {
    const auto flags = os.flags();
    const auto precision = os.precision();
    os << "Adjustment Plan:\n"
       << "  Actions: " << plan.actions.size() << "\n";
    for (std::size_t i = 0; i < plan.actions.size(); ++i) {
        os << "    " << i + 1 << ": " << plan.actions[i] << "\n";
    }
    os << std::fixed << std::setprecision(2) << "  Estimated Cost: " << plan.estimatedCost << "\n"
       << std::setprecision(4) << "  Residual Delta: " << plan.residualDelta << "\n"
       << "  Quality Score: " << plan.qualityScore << "\n";
    os.flags(flags);
    os.precision(precision);
    return os;
}

}

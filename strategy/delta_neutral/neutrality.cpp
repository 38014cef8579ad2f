/*
 * Filename: neutrality.cpp
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

#include "strategy/delta_neutral/neutrality.hpp"
#include "math/greeks/firstOrder.hpp"
#include "math/core/types.hpp"
#include "core/logger.hpp"
#include <algorithm>
#include <cmath>
#include <sstream>
#include <string>

namespace strategy {

using math::core::EPSILON;
using math::core::TOLERANCE;

namespace {

common::Result<double> perContractDelta(const portfolio::Position& position) {
    common::Option contract = position.getOption();
    if (contract.quantity > 0.0) {
        auto total = ::math::greeks::delta(contract);
        if (!common::isSuccess(total)) {
            return total;
        }
        return common::getValue(total) / contract.quantity;
    }
    contract.quantity = 1.0;
    return ::math::greeks::delta(contract);
}

}

common::Result<DeltaInfo> DeltaNeutrality::deltaNeutrality(double threshold) const {
    auto positions = getPositions();
    if (!common::isSuccess(positions)) {
        return common::getError(positions);
    }
    if (common::getValue(positions).empty()) {
        return common::makeError<DeltaInfo>(common::ErrorCode::RETRIEVAL_ERROR,
                                            getName() + " has no positions");
    }

    DeltaInfo info;
    info.neutralityThreshold = threshold;
    info.underlyingPrice = getUnderlyingPrice();

    for (const portfolio::Position* position : common::getValue(positions)) {
        auto legDelta = position->delta();
        if (!common::isSuccess(legDelta)) {
            return common::getError(legDelta);
        }
        auto unitDelta = perContractDelta(*position);
        if (!common::isSuccess(unitDelta)) {
            return common::getError(unitDelta);
        }

        const auto& option = position->getOption();
        DeltaPositionInfo leg;
        leg.delta = common::getValue(legDelta);
        leg.deltaPerContract = common::getValue(unitDelta);
        leg.quantity = option.quantity;
        leg.strike = option.strikePrice;
        leg.optionStyle = option.optionStyle;
        leg.side = option.side;

        info.netDelta += leg.delta;
        info.individualDeltas.push_back(leg);
    }

    info.isNeutral = std::abs(info.netDelta) <= threshold;
    return info;
}

bool DeltaNeutrality::isDeltaNeutral(double threshold) const {
    auto info = deltaNeutrality(threshold);
    return common::isSuccess(info) && common::getValue(info).isNeutral;
}

common::Result<std::vector<DeltaAdjustment>> DeltaNeutrality::deltaAdjustments(double threshold) const {
    auto result = deltaNeutrality(threshold);
    if (!common::isSuccess(result)) {
        return common::getError(result);
    }
    const DeltaInfo& info = common::getValue(result);

    std::vector<DeltaAdjustment> adjustments;
    if (info.isNeutral) {
        adjustments.push_back(DeltaAdjustment::noAdjustmentNeeded());
        return adjustments;
    }

    const double netDelta = info.netDelta;
    const DeltaPositionInfo* opposing = nullptr;
    const DeltaPositionInfo* aligned = nullptr;

    for (const auto& leg : info.individualDeltas) {
        const double unit = leg.deltaPerContract;
        if (std::abs(unit) < EPSILON) {
            continue;
        }

        const double quantity = std::abs(netDelta / unit);
        if (unit * netDelta < 0.0) {
            adjustments.push_back(
                DeltaAdjustment::buyOptions(quantity, leg.strike, leg.optionStyle, leg.side));
            if (!opposing) {
                opposing = &leg;
            }
            continue;
        }

        if (!aligned) {
            aligned = &leg;
        }
        if (quantity <= leg.quantity + TOLERANCE) {
            adjustments.push_back(DeltaAdjustment::sellOptions(
                std::min(quantity, leg.quantity), leg.strike, leg.optionStyle, leg.side));
        } else {
            core::Logger::getInstance().debug("cannot sell ", quantity, " of ", leg.side, " ",
                                              leg.optionStyle, " @ ", leg.strike, ", only ",
                                              leg.quantity, " held");
        }
    }

    if (opposing && aligned) {
        const double quantity = std::abs(netDelta) /
            (std::abs(opposing->deltaPerContract) + std::abs(aligned->deltaPerContract));
        if (quantity <= aligned->quantity + TOLERANCE) {
            adjustments.push_back(DeltaAdjustment::sameSize(
                DeltaAdjustment::buyOptions(quantity, opposing->strike, opposing->optionStyle,
                                            opposing->side),
                DeltaAdjustment::sellOptions(std::min(quantity, aligned->quantity),
                                             aligned->strike, aligned->optionStyle,
                                             aligned->side)));
        }
    }

    if (netDelta > 0.0) {
        adjustments.push_back(DeltaAdjustment::sellUnderlying(netDelta));
    } else {
        adjustments.push_back(DeltaAdjustment::buyUnderlying(std::abs(netDelta)));
    }

    return adjustments;
}

common::Result<AdjustmentReport> DeltaNeutrality::applyDeltaAdjustments(
    std::optional<common::Action> action, double threshold) {
    AdjustmentReport report;

    auto info = deltaNeutrality(threshold);
    if (!common::isSuccess(info)) {
        return common::getError(info);
    }
    if (common::getValue(info).isNeutral) {
        report.neutral = true;
        return report;
    }

    auto adjustments = deltaAdjustments(threshold);
    if (!common::isSuccess(adjustments)) {
        return common::getError(adjustments);
    }

    for (const auto& adjustment : common::getValue(adjustments)) {
        if (action) {
            const bool keep = (*action == common::Action::BUY && adjustment.is<BuyOptions>()) ||
                              (*action == common::Action::SELL && adjustment.is<SellOptions>());
            if (!keep) {
                core::Logger::getInstance().debug("skipping ", adjustment, " for action ", *action);
                ++report.skipped;
                continue;
            }
        }

        auto applied = applySingleAdjustment(adjustment);
        if (!common::isSuccess(applied)) {
            const auto& error = common::getError(applied);
            core::Logger::getInstance().warn(getName(), ": ", adjustment, " failed: ", error.toString());
            report.failures.push_back(error);
            continue;
        }
        report.applied.push_back(adjustment);

        if (isDeltaNeutral(threshold)) {
            break;
        }
    }

    report.neutral = isDeltaNeutral(threshold);
    return report;
}

common::Result<bool> DeltaNeutrality::applySingleAdjustment(const DeltaAdjustment& adjustment) {
    return applyAdjustment(adjustment, false);
}

common::Result<bool> DeltaNeutrality::applyAdjustment(const DeltaAdjustment& adjustment, bool nested) {
    if (adjustment.is<BuyOptions>()) {
        const auto& trade = adjustment.as<BuyOptions>();
        return adjustOptionPosition(trade.quantity, trade.strike, trade.optionStyle, trade.side);
    }
    if (adjustment.is<SellOptions>()) {
        const auto& trade = adjustment.as<SellOptions>();
        return adjustOptionPosition(-trade.quantity, trade.strike, trade.optionStyle, trade.side);
    }
    if (adjustment.is<BuyUnderlying>()) {
        return adjustUnderlyingPosition(adjustment.as<BuyUnderlying>().quantity);
    }
    if (adjustment.is<SellUnderlying>()) {
        return adjustUnderlyingPosition(-adjustment.as<SellUnderlying>().quantity);
    }
    if (adjustment.is<NoAdjustmentNeeded>()) {
        return true;
    }

    if (nested) {
        core::Logger::getInstance().warn("nested SameSize adjustments are not supported: ", adjustment);
        return common::makeError<bool>(common::ErrorCode::INVALID_ADJUSTMENT,
                                       "nested SameSize adjustment");
    }

    const auto& pair = adjustment.as<SameSize>();
    if (!pair.first || !pair.second) {
        return common::makeError<bool>(common::ErrorCode::INVALID_ADJUSTMENT,
                                       "SameSize adjustment is missing a trade");
    }
    for (const DeltaAdjustment* child : {pair.first.get(), pair.second.get()}) {
        auto resolvable = checkResolvable(*child);
        if (!common::isSuccess(resolvable)) {
            return resolvable;
        }
    }

    auto first = applyAdjustment(*pair.first, true);
    if (!common::isSuccess(first)) {
        return first;
    }
    return applyAdjustment(*pair.second, true);
}

// Both halves of a SameSize must be applicable before either is touched.
common::Result<bool> DeltaNeutrality::checkResolvable(const DeltaAdjustment& adjustment) {
    if (adjustment.is<SameSize>()) {
        core::Logger::getInstance().warn("nested SameSize adjustments are not supported: ", adjustment);
        return common::makeError<bool>(common::ErrorCode::INVALID_ADJUSTMENT,
                                       "nested SameSize adjustment");
    }
    if (adjustment.is<BuyOptions>()) {
        const auto& trade = adjustment.as<BuyOptions>();
        auto found = findPosition(trade.strike, trade.optionStyle, trade.side);
        if (!common::isSuccess(found)) {
            return common::getError(found);
        }
    }
    if (adjustment.is<SellOptions>()) {
        const auto& trade = adjustment.as<SellOptions>();
        auto found = findPosition(trade.strike, trade.optionStyle, trade.side);
        if (!common::isSuccess(found)) {
            return common::getError(found);
        }
        if (common::getValue(found)->getQuantity() - trade.quantity < -TOLERANCE) {
            return common::makeError<bool>(common::ErrorCode::INVALID_QUANTITY,
                                           "insufficient quantity to sell");
        }
    }
    return true;
}

common::Result<bool> DeltaNeutrality::adjustOptionPosition(double quantityDelta, double strike,
                                                           common::OptionStyle style,
                                                           common::Side side) {
    auto found = findPosition(strike, style, side);
    if (!common::isSuccess(found)) {
        return common::getError(found);
    }

    portfolio::Position* position = common::getValue(found);
    double quantity = position->getQuantity() + quantityDelta;
    if (quantity < 0.0) {
        if (quantity < -TOLERANCE) {
            std::ostringstream ss;
            ss << "adjusting " << side << " " << style << " @ " << strike << " by "
               << quantityDelta << " would leave " << quantity << " contracts";
            return common::makeError<bool>(common::ErrorCode::INVALID_QUANTITY, ss.str());
        }
        quantity = 0.0;
    }

    position->setQuantity(quantity);
    return true;
}

common::Result<bool> DeltaNeutrality::adjustUnderlyingPosition(double quantityDelta) {
    core::Logger::getInstance().info(getName(), ": underlying adjustment of ", quantityDelta, " ",
                                     getSymbol(), " requested, no underlying position is held");
    return true;
}

common::Result<PortfolioGreeks> DeltaNeutrality::portfolioGreeks() const {
    auto positions = getPositions();
    if (!common::isSuccess(positions)) {
        return common::getError(positions);
    }
    return PortfolioGreeks::fromPositions(common::getValue(positions));
}

common::Result<AdjustmentPlan> DeltaNeutrality::optimizeAdjustments(const AdjustmentTarget& target,
                                                                     const AdjustmentConfig& config) const {
    auto positions = getPositions();
    if (!common::isSuccess(positions)) {
        return common::getError(positions);
    }
    AdjustmentOptimizer optimizer(common::getValue(positions), getUnderlyingPrice(), config, target);
    return optimizer.optimize();
}

common::Result<bool> DeltaNeutrality::applyAdjustmentPlan(const AdjustmentPlan& plan) {
    auto positions = getMutablePositions();
    if (!common::isSuccess(positions)) {
        return common::getError(positions);
    }
    const auto& legs = common::getValue(positions);

    for (const auto& action : plan.actions) {
        if (action.is<AddUnderlying>()) {
            continue;
        }
        const std::size_t index = action.is<ModifyQuantity>() ? action.as<ModifyQuantity>().legIndex
                                                              : action.as<CloseLeg>().legIndex;
        if (index >= legs.size()) {
            return common::makeError<bool>(common::ErrorCode::INVALID_ADJUSTMENT,
                                           "leg index " + std::to_string(index) + " is out of range");
        }
        if (action.is<ModifyQuantity>() && action.as<ModifyQuantity>().newQuantity < 0.0) {
            return common::makeError<bool>(common::ErrorCode::INVALID_QUANTITY,
                                           "leg quantity cannot be negative");
        }
    }

    for (const auto& action : plan.actions) {
        if (action.is<ModifyQuantity>()) {
            const auto& modify = action.as<ModifyQuantity>();
            legs[modify.legIndex]->setQuantity(modify.newQuantity);
        } else if (action.is<CloseLeg>()) {
            legs[action.as<CloseLeg>().legIndex]->setQuantity(0.0);
        } else {
            auto applied = adjustUnderlyingPosition(action.as<AddUnderlying>().quantity);
            if (!common::isSuccess(applied)) {
                return common::getError(applied);
            }
        }
        core::Logger::getInstance().info(getName(), ": applied ", action);
    }
    return true;
}

}

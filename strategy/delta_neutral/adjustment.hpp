/*
 * Filename: adjustment.hpp
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

#include "strategy/delta_neutral/portfolio.hpp"
#include "common/types.hpp"
#include <cstddef>
#include <optional>
#include <ostream>
#include <utility>
#include <variant>
#include <vector>

namespace strategy {

// Leg indices refer to the order of getPositions().
struct ModifyQuantity {
    std::size_t legIndex = 0;
    double newQuantity = 0.0;
};

struct CloseLeg {
    std::size_t legIndex = 0;
};

// Positive buys shares, negative sells them.
struct AddUnderlying {
    double quantity = 0.0;
};

class AdjustmentAction {
public:
    using Variant = std::variant<ModifyQuantity, CloseLeg, AddUnderlying>;

private:
    Variant value_;

public:
    AdjustmentAction(Variant value) : value_(std::move(value)) {}

    static AdjustmentAction modifyQuantity(std::size_t legIndex, double newQuantity);
    static AdjustmentAction closeLeg(std::size_t legIndex);
    static AdjustmentAction addUnderlying(double quantity);

    const Variant& value() const { return value_; }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(value_); }

    template<typename T>
    const T& as() const { return std::get<T>(value_); }

    bool operator==(const AdjustmentAction& other) const;
    bool operator!=(const AdjustmentAction& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const AdjustmentAction& action);

struct AdjustmentConfig {
    bool allowUnderlying = false;
    bool preferExistingLegs = true;
    std::vector<common::OptionStyle> allowedStyles = {common::OptionStyle::CALL,
                                                      common::OptionStyle::PUT};
    // Inclusive strike bounds for the legs that may be resized.
    std::optional<std::pair<double, double>> strikeRange;
    std::optional<double> maxCost;
    double deltaTolerance = 0.01;

    static AdjustmentConfig existingLegsOnly();
    static AdjustmentConfig withUnderlying();

    bool allowsLeg(const portfolio::Position& position) const;
};

struct AdjustmentPlan {
    std::vector<AdjustmentAction> actions;
    double estimatedCost = 0.0;
    PortfolioGreeks resultingGreeks;
    double residualDelta = 0.0;
    // Lower is better: residual delta plus one percent of the cost.
    double qualityScore = 0.0;

    AdjustmentPlan() = default;
    AdjustmentPlan(std::vector<AdjustmentAction> actions, double estimatedCost,
                   const PortfolioGreeks& resultingGreeks, double residualDelta);

    bool isDeltaNeutral(double tolerance) const;
    bool isEmpty() const { return actions.empty(); }
    std::size_t actionCount() const { return actions.size(); }
};

std::ostream& operator<<(std::ostream& os, const AdjustmentPlan& plan);

}

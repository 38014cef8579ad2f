/*
 * Filename: base.hpp
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

#include "strategy/delta_neutral/neutrality.hpp"
#include "common/expiration.hpp"
#include "portfolio/position.hpp"
#include <string>
#include <vector>

namespace strategy {

// Market inputs shared by every leg of a strategy.
struct StrategyParams {
    std::string symbol;
    double underlyingPrice = 0.0;
    common::ExpirationDate expiration;
    double impliedVolatility = 0.0;
    double riskFreeRate = 0.0;
    double dividendYield = 0.0;
    double quantity = 1.0;
    double openFee = 0.0;
    double closeFee = 0.0;
};

class BaseStrategy : public DeltaNeutrality {
protected:
    std::string name_;
    std::string symbol_;
    double underlyingPrice_;
    std::string description_;
    std::vector<portfolio::Position> positions_;

    BaseStrategy(std::string name, std::string symbol, double underlyingPrice,
                 std::string description = "");

    portfolio::Position makeLeg(const StrategyParams& params, common::Side side,
                                common::OptionStyle style, double strike, double premium) const;

    // Swaps in a leg with the same style and side; fixed shapes use this for addPosition.
    common::Result<bool> replaceLeg(const portfolio::Position& position);
    const portfolio::Position* findLeg(common::OptionStyle style, common::Side side) const;

    virtual common::Result<bool> validateShape() const { return true; }

public:
    ~BaseStrategy() override = default;

    common::Result<std::vector<common::Option>> getOptions() const override;

    common::Result<std::vector<const portfolio::Position*>> getPositions() const override;
    common::Result<std::vector<portfolio::Position*>> getMutablePositions() override;

    std::string getName() const override { return name_; }
    std::string getDescription() const override { return description_; }
    std::string getSymbol() const override { return symbol_; }

    double getUnderlyingPrice() const override { return underlyingPrice_; }
    common::Result<bool> setUnderlyingPrice(double price) override;

    common::Result<double> getAtmStrike() const override;
    std::vector<double> getStrikes() const override;

    common::Result<bool> validate() const override;

    double netCost() const;
    common::Result<double> theoreticalValue() const;
};

}

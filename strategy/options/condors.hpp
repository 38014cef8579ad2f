/*
 * Filename: condors.hpp
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

#include "strategy/base.hpp"

namespace strategy {

struct IronCondorPremiums {
    double shortCall = 0.0;
    double shortPut = 0.0;
    double longCall = 0.0;
    double longPut = 0.0;
};

class IronCondorStrategy : public BaseStrategy {
public:
    IronCondorStrategy(const StrategyParams& params, double shortCallStrike, double shortPutStrike,
                       double longCallStrike, double longPutStrike,
                       const IronCondorPremiums& premiums = {});
    ~IronCondorStrategy() override = default;

    common::Result<bool> addPosition(const portfolio::Position& position) override;

    const portfolio::Position& getShortCall() const;
    const portfolio::Position& getShortPut() const;
    const portfolio::Position& getLongCall() const;
    const portfolio::Position& getLongPut() const;

    double creditReceived() const;
    double maxLoss() const;

protected:
    common::Result<bool> validateShape() const override;
};

}

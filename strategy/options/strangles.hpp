/*
 * Filename: strangles.hpp
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

class ShortStrangle : public BaseStrategy {
public:
    ShortStrangle(const StrategyParams& params, double callStrike, double putStrike,
                  double callPremium = 0.0, double putPremium = 0.0);
    ~ShortStrangle() override = default;

    common::Result<bool> addPosition(const portfolio::Position& position) override;

    const portfolio::Position& getShortCall() const;
    const portfolio::Position& getShortPut() const;

protected:
    common::Result<bool> validateShape() const override;
};

class LongStrangle : public BaseStrategy {
public:
    LongStrangle(const StrategyParams& params, double callStrike, double putStrike,
                 double callPremium = 0.0, double putPremium = 0.0);
    ~LongStrangle() override = default;

    common::Result<bool> addPosition(const portfolio::Position& position) override;

    const portfolio::Position& getLongCall() const;
    const portfolio::Position& getLongPut() const;

protected:
    common::Result<bool> validateShape() const override;
};

}

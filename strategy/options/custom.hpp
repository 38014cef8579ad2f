/*
 * Filename: custom.hpp
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

// Any number of legs on one underlying, no shape constraints.
class CustomStrategy : public BaseStrategy {
public:
    CustomStrategy(const std::string& name, const std::string& symbol, double underlyingPrice,
                   const std::string& description = "");
    ~CustomStrategy() override = default;

    common::Result<bool> addPosition(const portfolio::Position& position) override;
    common::Result<bool> removePosition(double strike, common::OptionStyle style, common::Side side);
};

}

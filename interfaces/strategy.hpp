/*
 * Filename: strategy.hpp
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

#include "common/result.hpp"
#include <string>
#include <vector>

namespace strategy {

class IStrategy {
public:
    virtual ~IStrategy() = default;

    virtual std::string getName() const = 0;
    virtual std::string getDescription() const { return ""; }
    virtual std::string getSymbol() const = 0;

    virtual double getUnderlyingPrice() const = 0;
    virtual common::Result<bool> setUnderlyingPrice(double price) = 0;

    // Leg strike closest to the current underlying price.
    virtual common::Result<double> getAtmStrike() const = 0;
    virtual std::vector<double> getStrikes() const = 0;

    virtual common::Result<bool> validate() const = 0;
};

}

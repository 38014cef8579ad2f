/*
 * Filename: loader.hpp
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
#include "strategy/base.hpp"
#include <memory>
#include <string>
#include <nlohmann/json_fwd.hpp>

namespace core {

// Builds a strategy from a JSON document:
//   { "type", "symbol", "underlyingPrice", "expiration" | "expirationDays",
//     "impliedVolatility", "riskFreeRate", "dividendYield", "quantity",
//     "legs": [ { "side", "style", "strike", "premium", ... } ] }
// Leg fields other than side, style and strike override the top-level values.
class StrategyLoader {
public:
    static common::Result<std::unique_ptr<strategy::BaseStrategy>> loadFromFile(const std::string& filename);
    static common::Result<std::unique_ptr<strategy::BaseStrategy>> loadFromString(const std::string& text);
    static common::Result<std::unique_ptr<strategy::BaseStrategy>> fromJson(const nlohmann::json& document);
};

}

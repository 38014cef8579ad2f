/*
 * Filename: calculator.hpp
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

#include "common/greeks.hpp"
#include "common/option.hpp"
#include "common/result.hpp"
#include <functional>
#include <vector>

namespace math::greeks {

using GreekFunction = std::function<common::Result<double>(const common::Option&)>;

// All six per-contract Greeks of one option; alpha is left at zero since it
// only has meaning for an aggregate.
common::Result<common::Greeks> calculate(const common::Option& option);

// Sums one Greek over the contracts, stopping at the first failure.
common::Result<double> sum(const std::vector<common::Option>& options, const GreekFunction& greek);

common::Result<common::Greeks> aggregate(const std::vector<common::Option>& options);

double alphaOf(double gamma, double theta);

}

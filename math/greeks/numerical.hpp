/*
 * Filename: numerical.hpp
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

#include "common/option.hpp"
#include "common/result.hpp"

namespace math::greeks {

// Bump-and-reprice estimates from the Black-Scholes price, per long
// contract (no quantity or side scaling).
common::Result<double> numericalDelta(const common::Option& option, double bumpSize = 0.01);
common::Result<double> numericalGamma(const common::Option& option, double bumpSize = 0.01);
common::Result<double> numericalVega(const common::Option& option, double bumpSize = 0.0001);

}

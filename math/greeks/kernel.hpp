/*
 * Filename: kernel.hpp
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

#include "../core/types.hpp"
#include "common/result.hpp"

namespace math::greeks {

common::Result<core::Real> d1(core::Real spot, core::Real strike, core::Real riskFreeRate,
                              core::Real timeToExpiry, core::Real volatility);

common::Result<core::Real> d2(core::Real spot, core::Real strike, core::Real riskFreeRate,
                              core::Real timeToExpiry, core::Real volatility);

core::Real normalPDF(core::Real x);

// Evaluated with boost::math; the only failure is the decimal/float
// conversion of the argument.
common::Result<core::Real> normalCDF(core::Real x);

}

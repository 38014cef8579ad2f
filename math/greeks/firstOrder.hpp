/*
 * Filename: firstOrder.hpp
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

// First-order Black-Scholes sensitivities of a single contract, with
// continuous dividend yield. Every value is scaled by the contract quantity;
// only delta carries the long/short sign.

common::Result<double> delta(const common::Option& option);

common::Result<double> theta(const common::Option& option);

common::Result<double> vega(const common::Option& option);

common::Result<double> rho(const common::Option& option);

common::Result<double> rhoD(const common::Option& option);

}

/*
 * Filename: black_scholes.hpp
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
#include "common/option.hpp"
#include "common/result.hpp"

namespace math::pricing {

// Value of one contract from the holder's side, ignoring quantity and side.
common::Result<core::Real> blackScholesPrice(const common::Option& option);

core::Real intrinsicValue(const common::Option& option);

}

/*
 * Filename: greeks.hpp
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
#include "common/greeks.hpp"
#include <vector>

namespace common {
class Option;
}

namespace math::greeks {

// Anything that can enumerate its option contracts gets the full set of
// aggregated Greeks. Implementers only provide getOptions().
class IGreeks {
public:
    virtual ~IGreeks() = default;

    virtual common::Result<std::vector<common::Option>> getOptions() const = 0;

    common::Result<common::Greeks> greeks() const;

    common::Result<double> delta() const;
    common::Result<double> gamma() const;
    common::Result<double> theta() const;
    common::Result<double> vega() const;
    common::Result<double> rho() const;
    common::Result<double> rhoD() const;
    common::Result<double> alpha() const;
};

}

/*
 * Filename: positionable.hpp
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
#include "common/types.hpp"
#include "portfolio/position.hpp"
#include <vector>

namespace strategy {

class IPositionable {
public:
    virtual ~IPositionable() = default;

    virtual common::Result<std::vector<const portfolio::Position*>> getPositions() const = 0;
    virtual common::Result<std::vector<portfolio::Position*>> getMutablePositions() = 0;
    virtual common::Result<bool> addPosition(const portfolio::Position& position) = 0;

    // Exact (strike, style, side) lookup.
    common::Result<portfolio::Position*> findPosition(double strike, common::OptionStyle style,
                                                      common::Side side);

    // Replaces the leg with the same strike, style and side.
    common::Result<bool> modifyPosition(const portfolio::Position& position);
};

}

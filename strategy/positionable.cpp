/*
 * Filename: positionable.cpp
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

#include "interfaces/positionable.hpp"
#include <sstream>

namespace strategy {

common::Result<portfolio::Position*> IPositionable::findPosition(double strike, common::OptionStyle style,
                                                                 common::Side side) {
    auto positions = getMutablePositions();
    if (!common::isSuccess(positions)) {
        return common::getError(positions);
    }

    for (portfolio::Position* position : common::getValue(positions)) {
        if (position->matches(strike, style, side)) {
            return position;
        }
    }

    std::ostringstream ss;
    ss << "no " << side << " " << style << " position at strike " << strike;
    return common::makeError<portfolio::Position*>(common::ErrorCode::POSITION_NOT_FOUND, ss.str());
}

common::Result<bool> IPositionable::modifyPosition(const portfolio::Position& position) {
    const auto& option = position.getOption();
    auto existing = findPosition(option.strikePrice, option.optionStyle, option.side);
    if (!common::isSuccess(existing)) {
        return common::getError(existing);
    }
    *common::getValue(existing) = position;
    return true;
}

}

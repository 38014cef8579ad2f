/*
 * Filename: types.hpp
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

#include "result.hpp"
#include <optional>
#include <ostream>
#include <string>

namespace common {

enum class OptionStyle {
    CALL, PUT
};

enum class Side {
    LONG, SHORT
};

enum class Action {
    BUY, SELL
};

const char* toString(OptionStyle style);
const char* toString(Side side);
const char* toString(Action action);

Result<OptionStyle> parseOptionStyle(const std::string& text);
Result<Side> parseSide(const std::string& text);
Result<std::optional<Action>> parseAction(const std::string& text);

std::ostream& operator<<(std::ostream& os, OptionStyle style);
std::ostream& operator<<(std::ostream& os, Side side);
std::ostream& operator<<(std::ostream& os, Action action);

}

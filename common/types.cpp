/*
 * Filename: types.cpp
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

#include "types.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace common {

namespace {

std::string normalize(std::string text) {
    text.erase(std::remove_if(text.begin(), text.end(), ::isspace), text.end());
    std::transform(text.begin(), text.end(), text.begin(), ::tolower);
    return text;
}

}

const char* toString(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_PRICE: return "InvalidPrice";
        case ErrorCode::INVALID_STRIKE: return "InvalidStrike";
        case ErrorCode::INVALID_VOLATILITY: return "InvalidVolatility";
        case ErrorCode::INVALID_TIME: return "InvalidTime";
        case ErrorCode::INVALID_RATE: return "InvalidRate";
        case ErrorCode::INVALID_QUANTITY: return "InvalidQuantity";
        case ErrorCode::CONVERSION_ERROR: return "ConversionError";
        case ErrorCode::RETRIEVAL_ERROR: return "RetrievalError";
        case ErrorCode::POSITION_NOT_FOUND: return "PositionNotFound";
        case ErrorCode::INVALID_ADJUSTMENT: return "InvalidAdjustment";
        case ErrorCode::INVALID_STRATEGY: return "InvalidStrategy";
        case ErrorCode::NO_VIABLE_PLAN: return "NoViablePlan";
        case ErrorCode::COST_EXCEEDED: return "CostExceeded";
        case ErrorCode::CONFIG_ERROR: return "ConfigError";
        case ErrorCode::PARSE_ERROR: return "ParseError";
    }
    return "Unknown";
}

bool Error::isInputError() const {
    switch (code) {
        case ErrorCode::INVALID_PRICE:
        case ErrorCode::INVALID_STRIKE:
        case ErrorCode::INVALID_VOLATILITY:
        case ErrorCode::INVALID_TIME:
        case ErrorCode::INVALID_RATE:
        case ErrorCode::INVALID_QUANTITY:
            return true;
        default:
            return false;
    }
}

std::string Error::toString() const {
    std::ostringstream ss;
    ss << common::toString(code) << ": " << message;
    return ss.str();
}

const char* toString(OptionStyle style) {
    return style == OptionStyle::CALL ? "Call" : "Put";
}

const char* toString(Side side) {
    return side == Side::LONG ? "Long" : "Short";
}

const char* toString(Action action) {
    return action == Action::BUY ? "Buy" : "Sell";
}

Result<OptionStyle> parseOptionStyle(const std::string& text) {
    const auto value = normalize(text);
    if (value == "call" || value == "c") return OptionStyle::CALL;
    if (value == "put" || value == "p") return OptionStyle::PUT;
    return makeError<OptionStyle>(ErrorCode::PARSE_ERROR, "unknown option style '" + text + "'");
}

Result<Side> parseSide(const std::string& text) {
    const auto value = normalize(text);
    if (value == "long") return Side::LONG;
    if (value == "short") return Side::SHORT;
    return makeError<Side>(ErrorCode::PARSE_ERROR, "unknown side '" + text + "'");
}

Result<std::optional<Action>> parseAction(const std::string& text) {
    const auto value = normalize(text);
    if (value == "buy") return std::optional<Action>(Action::BUY);
    if (value == "sell") return std::optional<Action>(Action::SELL);
    if (value == "all" || value == "none" || value.empty()) return std::optional<Action>();
    return makeError<std::optional<Action>>(ErrorCode::PARSE_ERROR, "unknown action '" + text + "'");
}

std::ostream& operator<<(std::ostream& os, OptionStyle style) {
    return os << toString(style);
}

std::ostream& operator<<(std::ostream& os, Side side) {
    return os << toString(side);
}

std::ostream& operator<<(std::ostream& os, Action action) {
    return os << toString(action);
}

}

/*
 * Filename: result.hpp
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

#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace common {

enum class ErrorCode {
    INVALID_PRICE,
    INVALID_STRIKE,
    INVALID_VOLATILITY,
    INVALID_TIME,
    INVALID_RATE,
    INVALID_QUANTITY,
    CONVERSION_ERROR,
    RETRIEVAL_ERROR,
    POSITION_NOT_FOUND,
    INVALID_ADJUSTMENT,
    INVALID_STRATEGY,
    NO_VIABLE_PLAN,
    COST_EXCEEDED,
    CONFIG_ERROR,
    PARSE_ERROR
};

struct Error {
    ErrorCode code;
    std::string message;

    Error(ErrorCode c, std::string msg) : code(c), message(std::move(msg)) {}

    bool isInputError() const;
    std::string toString() const;
};

const char* toString(ErrorCode code);

template<typename T>
using Result = std::variant<T, Error>;

template<typename T>
bool isSuccess(const Result<T>& result) {
    return std::holds_alternative<T>(result);
}

template<typename T>
const T& getValue(const Result<T>& result) {
    return std::get<T>(result);
}

template<typename T>
T& getValue(Result<T>& result) {
    return std::get<T>(result);
}

template<typename T>
const Error& getError(const Result<T>& result) {
    return std::get<Error>(result);
}

template<typename T>
Result<std::decay_t<T>> makeSuccess(T&& value) {
    return Result<std::decay_t<T>>(std::in_place_index<0>, std::forward<T>(value));
}

template<typename T>
Result<T> makeError(ErrorCode code, const std::string& message) {
    return Result<T>(std::in_place_index<1>, code, message);
}

template<typename T>
Result<T> makeError(const Error& error) {
    return Result<T>(std::in_place_index<1>, error);
}

}

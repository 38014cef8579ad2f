/*
 * Filename: loader.cpp
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

#include "core/loader.hpp"
#include "strategy/options/condors.hpp"
#include "strategy/options/custom.hpp"
#include "strategy/options/spreads.hpp"
#include "strategy/options/straddles.hpp"
#include "strategy/options/strangles.hpp"
#include "core/logger.hpp"
#include <fstream>
#include <sstream>
#include <vector>
#include <nlohmann/json.hpp>

namespace core {

using strategy::BaseStrategy;
using strategy::StrategyParams;
using StrategyResult = common::Result<std::unique_ptr<BaseStrategy>>;

namespace {

StrategyResult parseError(const std::string& message) {
    return common::makeError<std::unique_ptr<BaseStrategy>>(common::ErrorCode::PARSE_ERROR, message);
}

common::Result<common::ExpirationDate> parseExpiration(const nlohmann::json& j,
                                                       const common::ExpirationDate& fallback,
                                                       bool required) {
    if (j.contains("expiration")) {
        return common::ExpirationDate::parse(j["expiration"].get<std::string>());
    }
    if (j.contains("expirationDays")) {
        return common::ExpirationDate::fromDays(j["expirationDays"].get<double>());
    }
    if (required) {
        return common::makeError<common::ExpirationDate>(common::ErrorCode::PARSE_ERROR,
                                                         "missing 'expiration' or 'expirationDays'");
    }
    return fallback;
}

common::Result<StrategyParams> parseParams(const nlohmann::json& j) {
    StrategyParams params;
    params.symbol = j.at("symbol").get<std::string>();
    params.underlyingPrice = j.at("underlyingPrice").get<double>();
    params.impliedVolatility = j.value("impliedVolatility", 0.0);
    params.riskFreeRate = j.value("riskFreeRate", 0.0);
    params.dividendYield = j.value("dividendYield", 0.0);
    params.quantity = j.value("quantity", 1.0);
    params.openFee = j.value("openFee", 0.0);
    params.closeFee = j.value("closeFee", 0.0);

    auto expiration = parseExpiration(j, params.expiration, true);
    if (!common::isSuccess(expiration)) {
        return common::getError(expiration);
    }
    params.expiration = common::getValue(expiration);
    return params;
}

common::Result<portfolio::Position> parseLeg(const nlohmann::json& leg, const StrategyParams& params) {
    auto side = common::parseSide(leg.at("side").get<std::string>());
    if (!common::isSuccess(side)) {
        return common::getError(side);
    }
    auto style = common::parseOptionStyle(leg.at("style").get<std::string>());
    if (!common::isSuccess(style)) {
        return common::getError(style);
    }
    auto expiration = parseExpiration(leg, params.expiration, false);
    if (!common::isSuccess(expiration)) {
        return common::getError(expiration);
    }

    common::Option option(common::getValue(side), common::getValue(style), params.symbol,
                          leg.at("strike").get<double>(), common::getValue(expiration),
                          leg.value("impliedVolatility", params.impliedVolatility),
                          leg.value("quantity", params.quantity), params.underlyingPrice,
                          leg.value("riskFreeRate", params.riskFreeRate),
                          leg.value("dividendYield", params.dividendYield));

    return portfolio::Position(option, leg.value("premium", 0.0),
                               leg.value("openFee", params.openFee),
                               leg.value("closeFee", params.closeFee));
}

const portfolio::Position* legFor(const std::vector<portfolio::Position>& legs,
                                  common::OptionStyle style, common::Side side) {
    for (const auto& leg : legs) {
        if (leg.getOption().optionStyle == style && leg.getOption().side == side) {
            return &leg;
        }
    }
    return nullptr;
}

// Fixed shapes are built from their legs' strikes, then every parsed leg is
// swapped in so per-leg overrides survive.
std::unique_ptr<BaseStrategy> buildShape(const std::string& type, const StrategyParams& params,
                                         const std::vector<portfolio::Position>& legs,
                                         std::string& missing) {
    using common::OptionStyle;
    using common::Side;

    auto require = [&](OptionStyle style, Side side) -> const portfolio::Position* {
        const portfolio::Position* leg = legFor(legs, style, side);
        if (!leg && missing.empty()) {
            std::ostringstream ss;
            ss << type << " needs a " << side << " " << style << " leg";
            missing = ss.str();
        }
        return leg;
    };

    if (type == "short_strangle" || type == "long_strangle" ||
        type == "short_straddle" || type == "long_straddle") {
        const Side side = (type.rfind("short", 0) == 0) ? Side::SHORT : Side::LONG;
        const auto* call = require(OptionStyle::CALL, side);
        const auto* put = require(OptionStyle::PUT, side);
        if (!call || !put) {
            return nullptr;
        }
        if (type == "short_strangle") {
            return std::make_unique<strategy::ShortStrangle>(params, call->getStrike(), put->getStrike());
        }
        if (type == "long_strangle") {
            return std::make_unique<strategy::LongStrangle>(params, call->getStrike(), put->getStrike());
        }
        if (type == "short_straddle") {
            return std::make_unique<strategy::ShortStraddle>(params, call->getStrike());
        }
        return std::make_unique<strategy::LongStraddle>(params, call->getStrike());
    }

    if (type == "bull_call_spread") {
        const auto* longCall = require(OptionStyle::CALL, Side::LONG);
        const auto* shortCall = require(OptionStyle::CALL, Side::SHORT);
        if (!longCall || !shortCall) {
            return nullptr;
        }
        return std::make_unique<strategy::BullCallSpread>(params, longCall->getStrike(),
                                                          shortCall->getStrike());
    }

    if (type == "bear_put_spread") {
        const auto* longPut = require(OptionStyle::PUT, Side::LONG);
        const auto* shortPut = require(OptionStyle::PUT, Side::SHORT);
        if (!longPut || !shortPut) {
            return nullptr;
        }
        return std::make_unique<strategy::BearPutSpread>(params, longPut->getStrike(),
                                                         shortPut->getStrike());
    }

    if (type == "iron_condor") {
        const auto* shortCall = require(OptionStyle::CALL, Side::SHORT);
        const auto* shortPut = require(OptionStyle::PUT, Side::SHORT);
        const auto* longCall = require(OptionStyle::CALL, Side::LONG);
        const auto* longPut = require(OptionStyle::PUT, Side::LONG);
        if (!shortCall || !shortPut || !longCall || !longPut) {
            return nullptr;
        }
        return std::make_unique<strategy::IronCondorStrategy>(
            params, shortCall->getStrike(), shortPut->getStrike(), longCall->getStrike(),
            longPut->getStrike());
    }

    missing = "unknown strategy type '" + type + "'";
    return nullptr;
}

}

StrategyResult StrategyLoader::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return parseError("cannot open strategy file '" + filename + "'");
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return loadFromString(buffer.str());
}

StrategyResult StrategyLoader::loadFromString(const std::string& text) {
    nlohmann::json document;
    try {
        document = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return parseError(std::string("malformed strategy document: ") + e.what());
    }
    return fromJson(document);
}

StrategyResult StrategyLoader::fromJson(const nlohmann::json& document) {
    std::string type;
    std::string name;
    std::string description;
    StrategyParams params;
    std::vector<portfolio::Position> legs;

    try {
        if (!document.is_object()) {
            return parseError("strategy document must be a JSON object");
        }
        type = document.at("type").get<std::string>();
        name = document.value("name", std::string("Custom Strategy"));
        description = document.value("description", std::string());

        auto parsed = parseParams(document);
        if (!common::isSuccess(parsed)) {
            return common::getError(parsed);
        }
        params = common::getValue(parsed);

        if (!document.contains("legs") || !document["legs"].is_array()) {
            return parseError("strategy document needs a 'legs' array");
        }
        for (const auto& legJson : document["legs"]) {
            auto leg = parseLeg(legJson, params);
            if (!common::isSuccess(leg)) {
                return common::getError(leg);
            }
            legs.push_back(common::getValue(leg));
        }
    } catch (const nlohmann::json::exception& e) {
        return parseError(std::string("invalid strategy document: ") + e.what());
    }

    std::unique_ptr<BaseStrategy> loaded;
    if (type == "custom") {
        loaded = std::make_unique<strategy::CustomStrategy>(name, params.symbol,
                                                            params.underlyingPrice, description);
    } else {
        std::string missing;
        loaded = buildShape(type, params, legs, missing);
        if (!loaded) {
            return common::makeError<std::unique_ptr<BaseStrategy>>(
                common::ErrorCode::INVALID_STRATEGY, missing);
        }
    }

    for (const auto& leg : legs) {
        auto added = loaded->addPosition(leg);
        if (!common::isSuccess(added)) {
            return common::getError(added);
        }
    }

    auto valid = loaded->validate();
    if (!common::isSuccess(valid)) {
        return common::getError(valid);
    }

    Logger::getInstance().debug("loaded ", loaded->getName(), " on ", loaded->getSymbol(),
                                " with ", legs.size(), " legs");
    return StrategyResult(std::in_place_index<0>, std::move(loaded));
}

}

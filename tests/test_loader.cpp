/*
 * Filename: test_loader.cpp
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

#include <gtest/gtest.h>
#include "core/loader.hpp"
#include "strategy/options/strangles.hpp"
#include <filesystem>
#include <fstream>

using core::StrategyLoader;

namespace {

const char* SHORT_STRANGLE = R"({
    "type": "short_strangle",
    "symbol": "SPY",
    "underlyingPrice": 100.0,
    "expirationDays": 30,
    "impliedVolatility": 0.2,
    "riskFreeRate": 0.05,
    "dividendYield": 0.01,
    "legs": [
        { "side": "short", "style": "call", "strike": 110.0, "premium": 1.25 },
        { "side": "short", "style": "put", "strike": 90.0, "premium": 1.10, "quantity": 3 }
    ]
})";

common::ErrorCode loadError(const std::string& text) {
    auto result = StrategyLoader::loadFromString(text);
    EXPECT_FALSE(common::isSuccess(result));
    if (common::isSuccess(result)) {
        return common::ErrorCode::INVALID_STRATEGY;
    }
    return common::getError(result).code;
}

}

TEST(LoaderTest, BuildsShortStrangle) {
    auto result = StrategyLoader::loadFromString(SHORT_STRANGLE);
    ASSERT_TRUE(common::isSuccess(result)) << common::getError(result).toString();
    const auto& loaded = common::getValue(result);

    EXPECT_EQ(loaded->getName(), "Short Strangle");
    EXPECT_EQ(loaded->getSymbol(), "SPY");
    EXPECT_EQ(loaded->getStrikes(), (std::vector<double>{90.0, 110.0}));

    auto* strangle = dynamic_cast<strategy::ShortStrangle*>(loaded.get());
    ASSERT_NE(strangle, nullptr);
    EXPECT_DOUBLE_EQ(strangle->getShortCall().getPremium(), 1.25);
    EXPECT_DOUBLE_EQ(strangle->getShortCall().getQuantity(), 1.0);
    EXPECT_DOUBLE_EQ(strangle->getShortPut().getQuantity(), 3.0);
    EXPECT_DOUBLE_EQ(strangle->getShortPut().getOption().impliedVolatility, 0.2);
    EXPECT_TRUE(common::isSuccess(loaded->deltaNeutrality()));
}

TEST(LoaderTest, BuildsEveryShape) {
    const std::vector<std::pair<std::string, std::string>> shapes = {
        {"long_strangle", R"([{"side":"long","style":"call","strike":110},{"side":"long","style":"put","strike":90}])"},
        {"short_straddle", R"([{"side":"short","style":"call","strike":100},{"side":"short","style":"put","strike":100}])"},
        {"long_straddle", R"([{"side":"long","style":"call","strike":100},{"side":"long","style":"put","strike":100}])"},
        {"bull_call_spread", R"([{"side":"long","style":"call","strike":95},{"side":"short","style":"call","strike":105}])"},
        {"bear_put_spread", R"([{"side":"long","style":"put","strike":105},{"side":"short","style":"put","strike":95}])"},
        {"iron_condor", R"([{"side":"short","style":"call","strike":110},{"side":"short","style":"put","strike":90},
                           {"side":"long","style":"call","strike":120},{"side":"long","style":"put","strike":80}])"},
    };

    for (const auto& [type, legs] : shapes) {
        const std::string document = R"({"type":")" + type +
            R"(","symbol":"QQQ","underlyingPrice":100,"expiration":"2099-12-18","impliedVolatility":0.3,"legs":)" +
            legs + "}";
        auto result = StrategyLoader::loadFromString(document);
        ASSERT_TRUE(common::isSuccess(result)) << type << ": " << common::getError(result).toString();
        EXPECT_EQ(common::getValue(result)->getSymbol(), "QQQ") << type;
    }
}

TEST(LoaderTest, BuildsCustomStrategy) {
    auto result = StrategyLoader::loadFromString(R"({
        "type": "custom",
        "name": "Call Ratio",
        "symbol": "IWM",
        "underlyingPrice": 200,
        "expirationDays": 60,
        "impliedVolatility": 0.25,
        "legs": [
            { "side": "long", "style": "call", "strike": 200 },
            { "side": "short", "style": "call", "strike": 210, "quantity": 2 },
            { "side": "long", "style": "put", "strike": 190, "expirationDays": 90 }
        ]
    })");
    ASSERT_TRUE(common::isSuccess(result)) << common::getError(result).toString();
    const auto& loaded = common::getValue(result);

    EXPECT_EQ(loaded->getName(), "Call Ratio");
    EXPECT_EQ(common::getValue(loaded->getPositions()).size(), 3u);
    auto put = loaded->findPosition(190.0, common::OptionStyle::PUT, common::Side::LONG);
    ASSERT_TRUE(common::isSuccess(put));
    EXPECT_DOUBLE_EQ(common::getValue(put)->getOption().expirationDate.getDays(), 90.0);
}

TEST(LoaderTest, LoadsFromFile) {
    const auto path = (std::filesystem::temp_directory_path() / "deltadesk_strategy_test.json").string();
    {
        std::ofstream file(path);
        file << SHORT_STRANGLE;
    }

    auto result = StrategyLoader::loadFromFile(path);
    std::filesystem::remove(path);
    ASSERT_TRUE(common::isSuccess(result));
    EXPECT_EQ(common::getValue(result)->getName(), "Short Strangle");

    EXPECT_EQ(common::getError(StrategyLoader::loadFromFile("/nonexistent/strategy.json")).code,
              common::ErrorCode::PARSE_ERROR);
}

TEST(LoaderTest, RejectsMalformedDocuments) {
    EXPECT_EQ(loadError("{ \"type\": "), common::ErrorCode::PARSE_ERROR);
    EXPECT_EQ(loadError("42"), common::ErrorCode::PARSE_ERROR);
    EXPECT_EQ(loadError(R"({"type":"custom","underlyingPrice":100,"expirationDays":30,"legs":[]})"),
              common::ErrorCode::PARSE_ERROR);
    EXPECT_EQ(loadError(R"({"type":"custom","symbol":"SPY","underlyingPrice":100,"legs":[]})"),
              common::ErrorCode::PARSE_ERROR);
    EXPECT_EQ(loadError(R"({"type":"custom","symbol":"SPY","underlyingPrice":100,"expirationDays":30})"),
              common::ErrorCode::PARSE_ERROR);
    EXPECT_EQ(loadError(R"({"type":"custom","symbol":"SPY","underlyingPrice":100,"expirationDays":30,
                            "legs":[{"side":"sideways","style":"call","strike":100}]})"),
              common::ErrorCode::PARSE_ERROR);
    EXPECT_EQ(loadError(R"({"type":"custom","symbol":"SPY","underlyingPrice":100,"expiration":"soon",
                            "legs":[{"side":"long","style":"call","strike":100}]})"),
              common::ErrorCode::PARSE_ERROR);
}

TEST(LoaderTest, RejectsInvalidStrategies) {
    EXPECT_EQ(loadError(R"({"type":"butterfly","symbol":"SPY","underlyingPrice":100,"expirationDays":30,
                            "legs":[{"side":"long","style":"call","strike":100}]})"),
              common::ErrorCode::INVALID_STRATEGY);
    EXPECT_EQ(loadError(R"({"type":"short_strangle","symbol":"SPY","underlyingPrice":100,"expirationDays":30,
                            "legs":[{"side":"short","style":"call","strike":110}]})"),
              common::ErrorCode::INVALID_STRATEGY);
    EXPECT_EQ(loadError(R"({"type":"short_strangle","symbol":"SPY","underlyingPrice":100,"expirationDays":30,
                            "impliedVolatility":0.2,
                            "legs":[{"side":"short","style":"call","strike":110},
                                    {"side":"short","style":"put","strike":90},
                                    {"side":"long","style":"put","strike":80}]})"),
              common::ErrorCode::INVALID_STRATEGY);
    EXPECT_EQ(loadError(R"({"type":"short_strangle","symbol":"SPY","underlyingPrice":100,"expirationDays":30,
                            "impliedVolatility":0.2,
                            "legs":[{"side":"short","style":"call","strike":90},
                                    {"side":"short","style":"put","strike":110}]})"),
              common::ErrorCode::INVALID_STRIKE);
    EXPECT_EQ(loadError(R"({"type":"custom","symbol":"SPY","underlyingPrice":100,"expirationDays":30,
                            "legs":[]})"),
              common::ErrorCode::INVALID_STRATEGY);
    EXPECT_EQ(loadError(R"({"type":"custom","symbol":"SPY","underlyingPrice":100,"expirationDays":-5,
                            "impliedVolatility":0.2,
                            "legs":[{"side":"long","style":"call","strike":100}]})"),
              common::ErrorCode::INVALID_TIME);
}

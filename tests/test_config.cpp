/*
 * Filename: test_config.cpp
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
#include "core/config.hpp"
#include "core/logger.hpp"
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <sstream>

using core::ApplicationConfig;
using core::ConfigManager;

TEST(ConfigTest, Defaults) {
    ApplicationConfig config;
    EXPECT_DOUBLE_EQ(config.deltaThreshold, 0.0001);
    EXPECT_EQ(config.logging.logLevel, "INFO");
    EXPECT_TRUE(common::isSuccess(ConfigManager::validate(config)));
}

TEST(ConfigTest, LoadFromString) {
    auto result = ConfigManager::loadFromString(R"({
        "deltaThreshold": 0.01,
        "logging": { "level": "debug", "file": "desk.log", "enableDebugLogging": true }
    })");
    ASSERT_TRUE(common::isSuccess(result));
    const auto& config = common::getValue(result);

    EXPECT_DOUBLE_EQ(config.deltaThreshold, 0.01);
    EXPECT_EQ(config.logging.logLevel, "debug");
    EXPECT_EQ(config.logging.logFile, "desk.log");
    EXPECT_TRUE(config.logging.enableDebugLogging);
}

TEST(ConfigTest, MissingKeysKeepDefaults) {
    auto result = ConfigManager::loadFromString("{}");
    ASSERT_TRUE(common::isSuccess(result));
    EXPECT_DOUBLE_EQ(common::getValue(result).deltaThreshold, 0.0001);
}

TEST(ConfigTest, RejectsBadDocuments) {
    EXPECT_EQ(common::getError(ConfigManager::loadFromString("{ not json")).code,
              common::ErrorCode::PARSE_ERROR);
    EXPECT_EQ(common::getError(ConfigManager::loadFromString("[1, 2]")).code,
              common::ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(common::getError(ConfigManager::loadFromString(R"({"deltaThreshold": "small"})")).code,
              common::ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(common::getError(ConfigManager::loadFromString(R"({"deltaThreshold": -1})")).code,
              common::ErrorCode::CONFIG_ERROR);
    EXPECT_EQ(common::getError(ConfigManager::loadFromString(R"({"logging": {"level": "chatty"}})")).code,
              common::ErrorCode::CONFIG_ERROR);
}

TEST(ConfigTest, MissingFileIsConfigError) {
    auto result = ConfigManager::loadFromFile("/nonexistent/deltadesk.json");
    ASSERT_FALSE(common::isSuccess(result));
    EXPECT_EQ(common::getError(result).code, common::ErrorCode::CONFIG_ERROR);
}

TEST(ConfigTest, SaveThenLoad) {
    const auto path = (std::filesystem::temp_directory_path() / "deltadesk_config_test.json").string();

    ApplicationConfig config;
    config.deltaThreshold = 0.005;
    config.logging.logLevel = "WARN";
    config.logging.logFile = "adjustments.log";
    ASSERT_TRUE(common::isSuccess(ConfigManager::saveToFile(config, path)));

    auto loaded = ConfigManager::loadFromFile(path);
    ASSERT_TRUE(common::isSuccess(loaded));
    EXPECT_DOUBLE_EQ(common::getValue(loaded).deltaThreshold, 0.005);
    EXPECT_EQ(common::getValue(loaded).logging.logLevel, "WARN");
    EXPECT_EQ(common::getValue(loaded).logging.logFile, "adjustments.log");
    EXPECT_EQ(common::getValue(loaded).configFile, path);

    std::filesystem::remove(path);
}

TEST(ConfigTest, EnvironmentOverlay) {
    setenv("DELTADESK_DELTA_THRESHOLD", "0.02", 1);
    setenv("DELTADESK_LOG_LEVEL", "ERROR", 1);

    ApplicationConfig base;
    base.logging.logFile = "kept.log";
    auto result = ConfigManager::loadFromEnvironment(base);

    unsetenv("DELTADESK_DELTA_THRESHOLD");
    unsetenv("DELTADESK_LOG_LEVEL");

    ASSERT_TRUE(common::isSuccess(result));
    EXPECT_DOUBLE_EQ(common::getValue(result).deltaThreshold, 0.02);
    EXPECT_EQ(common::getValue(result).logging.logLevel, "ERROR");
    EXPECT_EQ(common::getValue(result).logging.logFile, "kept.log");
}

TEST(ConfigTest, EnvironmentRejectsGarbage) {
    setenv("DELTADESK_DELTA_THRESHOLD", "0.02abc", 1);
    auto result = ConfigManager::loadFromEnvironment();
    unsetenv("DELTADESK_DELTA_THRESHOLD");

    ASSERT_FALSE(common::isSuccess(result));
    EXPECT_EQ(common::getError(result).code, common::ErrorCode::CONFIG_ERROR);
}

TEST(LoggerTest, ParsesLevels) {
    EXPECT_EQ(common::getValue(core::parseLogLevel("debug")), core::LogLevel::DEBUG);
    EXPECT_EQ(common::getValue(core::parseLogLevel("Warning")), core::LogLevel::WARN);
    EXPECT_EQ(common::getValue(core::parseLogLevel("OFF")), core::LogLevel::OFF);
    EXPECT_FALSE(common::isSuccess(core::parseLogLevel("verbose")));
}

TEST(LoggerTest, FiltersBelowLevel) {
    auto& logger = core::Logger::getInstance();
    std::ostringstream sink;
    logger.setStream(sink);
    logger.setLevel(core::LogLevel::WARN);

    logger.debug("hidden ", 1);
    logger.info("hidden ", 2);
    logger.warn("shown ", 3);
    logger.error("shown 4");

    const std::string output = sink.str();
    EXPECT_EQ(output.find("hidden"), std::string::npos);
    EXPECT_NE(output.find("[WARN] shown 3"), std::string::npos);
    EXPECT_NE(output.find("[ERROR] shown 4"), std::string::npos);

    logger.setLevel(core::LogLevel::OFF);
    logger.error("silenced");
    EXPECT_EQ(sink.str().find("silenced"), std::string::npos);

    logger.setStream(std::clog);
    logger.setLevel(core::LogLevel::INFO);
}

TEST(LoggerTest, SetupFromConfig) {
    ApplicationConfig config;
    config.logging.logLevel = "ERROR";
    config.logging.enableDebugLogging = true;
    ASSERT_TRUE(common::isSuccess(ConfigManager::setupLogging(config)));
    EXPECT_EQ(core::Logger::getInstance().getLevel(), core::LogLevel::DEBUG);

    config.logging.enableDebugLogging = false;
    config.logging.logFile = "/nonexistent/dir/deltadesk.log";
    auto result = ConfigManager::setupLogging(config);
    ASSERT_FALSE(common::isSuccess(result));
    EXPECT_EQ(common::getError(result).code, common::ErrorCode::CONFIG_ERROR);

    core::Logger::getInstance().setLevel(core::LogLevel::INFO);
}

/*
 * Filename: config.cpp
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

#include "core/config.hpp"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>

namespace core {

namespace {

common::Result<ApplicationConfig> fromJson(const nlohmann::json& j) {
    ApplicationConfig config;

    try {
        if (!j.is_object()) {
            return common::makeError<ApplicationConfig>(common::ErrorCode::CONFIG_ERROR,
                                                        "configuration must be a JSON object");
        }

        if (j.contains("deltaThreshold")) {
            config.deltaThreshold = j["deltaThreshold"].get<double>();
        }

        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            config.logging.enableDebugLogging = logging.value("enableDebugLogging", false);
            config.logging.logLevel = logging.value("level", config.logging.logLevel);
            config.logging.logFile = logging.value("file", config.logging.logFile);
        }
    } catch (const nlohmann::json::exception& e) {
        return common::makeError<ApplicationConfig>(common::ErrorCode::CONFIG_ERROR,
                                                    std::string("invalid configuration: ") + e.what());
    }

    auto valid = ConfigManager::validate(config);
    if (!common::isSuccess(valid)) {
        return common::getError(valid);
    }
    return config;
}

}

common::Result<ApplicationConfig> ConfigManager::loadFromFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        return common::makeError<ApplicationConfig>(common::ErrorCode::CONFIG_ERROR,
                                                    "cannot open configuration file '" + filename + "'");
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    auto config = loadFromString(buffer.str());
    if (common::isSuccess(config)) {
        common::getValue(config).configFile = filename;
    }
    return config;
}

common::Result<ApplicationConfig> ConfigManager::loadFromString(const std::string& text) {
    nlohmann::json j;
    try {
        j = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        return common::makeError<ApplicationConfig>(common::ErrorCode::PARSE_ERROR,
                                                    std::string("malformed configuration: ") + e.what());
    }
    return fromJson(j);
}

common::Result<bool> ConfigManager::saveToFile(const ApplicationConfig& config, const std::string& filename) {
    nlohmann::json j;
    j["deltaThreshold"] = config.deltaThreshold;
    j["logging"] = {
        {"enableDebugLogging", config.logging.enableDebugLogging},
        {"level", config.logging.logLevel},
        {"file", config.logging.logFile},
    };

    std::ofstream file(filename);
    if (!file.is_open()) {
        return common::makeError<bool>(common::ErrorCode::CONFIG_ERROR,
                                       "cannot write configuration file '" + filename + "'");
    }
    file << j.dump(4);
    return true;
}

common::Result<ApplicationConfig> ConfigManager::loadFromEnvironment(ApplicationConfig config) {
    if (const char* threshold = std::getenv("DELTADESK_DELTA_THRESHOLD")) {
        try {
            std::size_t consumed = 0;
            config.deltaThreshold = std::stod(threshold, &consumed);
            if (consumed != std::string(threshold).size()) {
                return common::makeError<ApplicationConfig>(
                    common::ErrorCode::CONFIG_ERROR,
                    std::string("DELTADESK_DELTA_THRESHOLD is not a number: ") + threshold);
            }
        } catch (const std::exception&) {
            return common::makeError<ApplicationConfig>(
                common::ErrorCode::CONFIG_ERROR,
                std::string("DELTADESK_DELTA_THRESHOLD is not a number: ") + threshold);
        }
    }

    if (const char* level = std::getenv("DELTADESK_LOG_LEVEL")) {
        config.logging.logLevel = level;
    }

    auto valid = validate(config);
    if (!common::isSuccess(valid)) {
        return common::getError(valid);
    }
    return config;
}

common::Result<bool> ConfigManager::validate(const ApplicationConfig& config) {
    if (!std::isfinite(config.deltaThreshold) || config.deltaThreshold < 0.0) {
        return common::makeError<bool>(common::ErrorCode::CONFIG_ERROR,
                                       "deltaThreshold must be a non-negative number");
    }
    auto level = parseLogLevel(config.logging.logLevel);
    if (!common::isSuccess(level)) {
        return common::getError(level);
    }
    return true;
}

common::Result<bool> ConfigManager::setupLogging(const ApplicationConfig& config) {
    auto level = parseLogLevel(config.logging.logLevel);
    if (!common::isSuccess(level)) {
        return common::getError(level);
    }

    auto& logger = Logger::getInstance();
    logger.setLevel(config.logging.enableDebugLogging ? LogLevel::DEBUG : common::getValue(level));
    return logger.setFile(config.logging.logFile);
}

}

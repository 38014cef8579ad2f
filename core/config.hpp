/*
 * Filename: config.hpp
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
#include "core/logger.hpp"
#include <string>

namespace core {

struct ApplicationConfig {
    double deltaThreshold = 0.0001;
    std::string configFile = "deltadesk.json";

    struct LoggingConfig {
        bool enableDebugLogging = false;
        std::string logLevel = "INFO";
        std::string logFile;
    } logging;
};

class ConfigManager {
public:
    static common::Result<ApplicationConfig> loadFromFile(const std::string& filename);
    static common::Result<ApplicationConfig> loadFromString(const std::string& text);
    static common::Result<bool> saveToFile(const ApplicationConfig& config, const std::string& filename);

    // Overlays DELTADESK_DELTA_THRESHOLD and DELTADESK_LOG_LEVEL on top of config.
    static common::Result<ApplicationConfig> loadFromEnvironment(ApplicationConfig config = {});

    static common::Result<bool> validate(const ApplicationConfig& config);

    // Applies the logging section to the global Logger.
    static common::Result<bool> setupLogging(const ApplicationConfig& config);
};

}

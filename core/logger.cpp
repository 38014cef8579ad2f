/*
 * Filename: logger.cpp
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

#include "core/logger.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace core {

std::unique_ptr<Logger> Logger::instance_;
std::once_flag Logger::instanceFlag_;

const char* toString(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::OFF: return "OFF";
    }
    return "UNKNOWN";
}

common::Result<LogLevel> parseLogLevel(const std::string& text) {
    std::string upper = text;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "OFF" || upper == "NONE") return LogLevel::OFF;

    return common::makeError<LogLevel>(common::ErrorCode::CONFIG_ERROR,
                                       "unknown log level '" + text + "'");
}

Logger::Logger() : sink_(&std::clog) {}

Logger& Logger::getInstance() {
    std::call_once(instanceFlag_, []() {
        instance_ = std::unique_ptr<Logger>(new Logger());
    });
    return *instance_;
}

bool Logger::isEnabled(LogLevel level) const {
    return level != LogLevel::OFF && level_ != LogLevel::OFF &&
           static_cast<int>(level) >= static_cast<int>(level_);
}

common::Result<bool> Logger::setFile(const std::string& path) {
    std::lock_guard<std::mutex> lock(sinkLock_);
    if (path.empty()) {
        file_.reset();
        sink_ = &std::clog;
        return true;
    }

    auto file = std::make_unique<std::ofstream>(path, std::ios::app);
    if (!file->is_open()) {
        return common::makeError<bool>(common::ErrorCode::CONFIG_ERROR,
                                       "cannot open log file '" + path + "'");
    }
    file_ = std::move(file);
    sink_ = file_.get();
    return true;
}

void Logger::setStream(std::ostream& stream) {
    std::lock_guard<std::mutex> lock(sinkLock_);
    file_.reset();
    sink_ = &stream;
}

void Logger::log(LogLevel level, const std::string& message) {
    if (!isEnabled(level)) {
        return;
    }

    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
    localtime_r(&now, &local);

    std::lock_guard<std::mutex> lock(sinkLock_);
    *sink_ << std::put_time(&local, "%Y-%m-%d %H:%M:%S") << " [" << toString(level) << "] "
           << message << std::endl;
}

}

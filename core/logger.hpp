/*
 * Filename: logger.hpp
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
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>

namespace core {

enum class LogLevel {
    DEBUG, INFO, WARN, ERROR, OFF
};

const char* toString(LogLevel level);
common::Result<LogLevel> parseLogLevel(const std::string& text);

class Logger {
private:
    LogLevel level_ = LogLevel::INFO;
    std::unique_ptr<std::ofstream> file_;
    std::ostream* sink_;
    std::mutex sinkLock_;

    static std::unique_ptr<Logger> instance_;
    static std::once_flag instanceFlag_;

    Logger();

public:
    ~Logger() = default;

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    static Logger& getInstance();

    void setLevel(LogLevel level) { level_ = level; }
    LogLevel getLevel() const { return level_; }
    bool isEnabled(LogLevel level) const;

    // Empty path restores std::clog.
    common::Result<bool> setFile(const std::string& path);
    void setStream(std::ostream& stream);

    void log(LogLevel level, const std::string& message);

    // Streams every argument into one line, only when the level is enabled.
    template<typename... Args>
    void log(LogLevel level, const Args&... args) {
        if (!isEnabled(level)) {
            return;
        }
        std::ostringstream line;
        (line << ... << args);
        log(level, line.str());
    }

    template<typename... Args>
    void debug(const Args&... args) { log(LogLevel::DEBUG, args...); }

    template<typename... Args>
    void info(const Args&... args) { log(LogLevel::INFO, args...); }

    template<typename... Args>
    void warn(const Args&... args) { log(LogLevel::WARN, args...); }

    template<typename... Args>
    void error(const Args&... args) { log(LogLevel::ERROR, args...); }
};

}

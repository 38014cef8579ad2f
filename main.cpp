/*
 * Filename: main.cpp
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
#include "core/loader.hpp"
#include "core/logger.hpp"
#include "common/types.hpp"
#include <iomanip>
#include <iostream>
#include <optional>
#include <string>

namespace {

void printBanner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════════════════════╗
  ║                                                           ║
  ║     DELTADESK  Options Greeks & Delta Neutrality          ║
  ║                                                           ║
  ╚═══════════════════════════════════════════════════════════╝
)" << std::endl;
}

void printUsage(const char* programName) {
    std::cout << "Usage: " << programName << " --strategy FILE [OPTIONS]\n\n"
              << "Options:\n"
              << "  --strategy FILE    Strategy description (JSON)\n"
              << "  --config FILE      Use specific configuration file\n"
              << "  --apply ACTION     Apply adjustments: buy, sell or all\n"
              << "  --threshold X      Delta neutrality threshold\n"
              << "  --log-level LEVEL  Set logging level (DEBUG, INFO, WARN, ERROR, OFF)\n"
              << "  --help             Show this help message\n"
              << "  --version          Show version information\n\n"
              << "Environment Variables:\n"
              << "  DELTADESK_DELTA_THRESHOLD  Neutrality threshold override\n"
              << "  DELTADESK_LOG_LEVEL        Logging level override\n"
              << std::endl;
}

void printGreeks(const strategy::BaseStrategy& strategy) {
    auto greeks = strategy.greeks();
    if (!common::isSuccess(greeks)) {
        std::cerr << "Failed to compute Greeks: " << common::getError(greeks).toString() << std::endl;
        return;
    }
    std::cout << "\nGreeks:\n  " << common::getValue(greeks) << std::endl;

    auto value = strategy.theoreticalValue();
    if (common::isSuccess(value)) {
        std::cout << "  Theoretical value: " << std::fixed << std::setprecision(2)
                  << common::getValue(value) << " | Net cost: " << strategy.netCost() << std::endl;
    }
}

int report(strategy::BaseStrategy& strategy, std::optional<common::Action> action, bool apply,
           double threshold) {
    std::cout << strategy.getName() << " on " << strategy.getSymbol() << " @ "
              << strategy.getUnderlyingPrice() << std::endl;
    if (!strategy.getDescription().empty()) {
        std::cout << "  " << strategy.getDescription() << std::endl;
    }

    printGreeks(strategy);

    auto info = strategy.deltaNeutrality(threshold);
    if (!common::isSuccess(info)) {
        std::cerr << "Failed to evaluate delta: " << common::getError(info).toString() << std::endl;
        return 1;
    }
    std::cout << "\n" << common::getValue(info);

    auto adjustments = strategy.deltaAdjustments(threshold);
    if (!common::isSuccess(adjustments)) {
        std::cerr << "Failed to propose adjustments: " << common::getError(adjustments).toString()
                  << std::endl;
        return 1;
    }
    std::cout << "\nProposed adjustments:" << std::endl;
    for (const auto& adjustment : common::getValue(adjustments)) {
        std::cout << "  " << adjustment << std::endl;
    }

    if (!apply) {
        return 0;
    }

    auto applied = strategy.applyDeltaAdjustments(action, threshold);
    if (!common::isSuccess(applied)) {
        std::cerr << "Failed to apply adjustments: " << common::getError(applied).toString() << std::endl;
        return 1;
    }

    const auto& result = common::getValue(applied);
    std::cout << "\nApplied " << result.applied.size() << " adjustment(s), skipped "
              << result.skipped << ", failed " << result.failures.size() << std::endl;
    for (const auto& adjustment : result.applied) {
        std::cout << "  + " << adjustment << std::endl;
    }
    for (const auto& failure : result.failures) {
        std::cout << "  ! " << failure.toString() << std::endl;
    }
    std::cout << "Delta neutral: " << (result.neutral ? "yes" : "no") << std::endl;

    auto after = strategy.deltaNeutrality(threshold);
    if (common::isSuccess(after)) {
        std::cout << "\n" << common::getValue(after);
    }
    return result.neutral ? 0 : 2;
}

}

int main(int argc, char* argv[]) {
    std::string configFile;
    std::string strategyFile;
    std::string logLevel;
    std::optional<double> threshold;
    std::optional<common::Action> action;
    bool apply = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            printUsage(argv[0]);
            return 0;
        } else if (arg == "--version") {
            std::cout << "DeltaDesk v1.0" << std::endl;
            return 0;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--strategy" && i + 1 < argc) {
            strategyFile = argv[++i];
        } else if (arg == "--log-level" && i + 1 < argc) {
            logLevel = argv[++i];
        } else if (arg == "--apply" && i + 1 < argc) {
            auto parsed = common::parseAction(argv[++i]);
            if (!common::isSuccess(parsed)) {
                std::cerr << common::getError(parsed).toString() << std::endl;
                return 1;
            }
            action = common::getValue(parsed);
            apply = true;
        } else if (arg == "--threshold" && i + 1 < argc) {
            try {
                threshold = std::stod(argv[++i]);
            } catch (const std::exception&) {
                std::cerr << "Invalid threshold: " << argv[i] << std::endl;
                return 1;
            }
        } else {
            std::cerr << "Unknown option: " << arg << std::endl;
            printUsage(argv[0]);
            return 1;
        }
    }

    if (strategyFile.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    printBanner();

    core::ApplicationConfig config;
    if (!configFile.empty()) {
        auto loaded = core::ConfigManager::loadFromFile(configFile);
        if (!common::isSuccess(loaded)) {
            std::cerr << "Failed to load config: " << common::getError(loaded).toString() << std::endl;
            return 1;
        }
        config = common::getValue(loaded);
        std::cout << "Configuration loaded from " << configFile << std::endl;
    }

    auto environment = core::ConfigManager::loadFromEnvironment(config);
    if (!common::isSuccess(environment)) {
        std::cerr << common::getError(environment).toString() << std::endl;
        return 1;
    }
    config = common::getValue(environment);

    if (!logLevel.empty()) {
        config.logging.logLevel = logLevel;
    }
    if (threshold) {
        config.deltaThreshold = *threshold;
    }

    auto valid = core::ConfigManager::validate(config);
    if (!common::isSuccess(valid)) {
        std::cerr << common::getError(valid).toString() << std::endl;
        return 1;
    }
    auto logging = core::ConfigManager::setupLogging(config);
    if (!common::isSuccess(logging)) {
        std::cerr << common::getError(logging).toString() << std::endl;
        return 1;
    }

    std::cout << "Configuration:" << std::endl;
    std::cout << "  Log Level: " << config.logging.logLevel << std::endl;
    std::cout << "  Delta Threshold: " << config.deltaThreshold << std::endl;

    auto strategy = core::StrategyLoader::loadFromFile(strategyFile);
    if (!common::isSuccess(strategy)) {
        std::cerr << "Failed to load strategy: " << common::getError(strategy).toString() << std::endl;
        return 1;
    }

    return report(*common::getValue(strategy), action, apply, config.deltaThreshold);
}

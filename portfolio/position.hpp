/*
 * Filename: position.hpp
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

#include "common/option.hpp"
#include "common/result.hpp"
#include "interfaces/greeks.hpp"
#include <chrono>
#include <ostream>
#include <vector>

namespace portfolio {

class Position : public math::greeks::IGreeks {
private:
    common::Option option_;
    double premium_;
    double openFee_;
    double closeFee_;
    std::chrono::system_clock::time_point openDate_;

public:
    Position();
    Position(const common::Option& option, double premium, double openFee = 0.0,
             double closeFee = 0.0,
             std::chrono::system_clock::time_point openDate = std::chrono::system_clock::now());
    ~Position() override = default;

    const common::Option& getOption() const { return option_; }
    common::Option& getOption() { return option_; }
    double getPremium() const { return premium_; }
    double getOpenFee() const { return openFee_; }
    double getCloseFee() const { return closeFee_; }
    double getQuantity() const { return option_.quantity; }
    double getStrike() const { return option_.strikePrice; }
    const std::chrono::system_clock::time_point& getOpenDate() const { return openDate_; }

    void setPremium(double premium) { premium_ = premium; }
    void setOpenFee(double openFee) { openFee_ = openFee; }
    void setCloseFee(double closeFee) { closeFee_ = closeFee; }
    void setQuantity(double quantity) { option_.quantity = quantity; }
    void setUnderlyingPrice(double price) { option_.underlyingPrice = price; }

    common::Result<std::vector<common::Option>> getOptions() const override;

    common::Result<bool> validate() const;

    bool isLong() const { return option_.isLong(); }
    bool isShort() const { return option_.isShort(); }

    double totalCost() const;
    double premiumReceived() const;
    double netCost() const;
    common::Result<double> theoreticalValue() const;

    bool matches(double strike, common::OptionStyle style, common::Side side) const;
};

std::ostream& operator<<(std::ostream& os, const Position& position);

}

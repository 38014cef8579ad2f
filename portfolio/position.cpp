/*
 * Filename: position.cpp
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

#include "portfolio/position.hpp"
#include "math/pricing/black_scholes.hpp"

namespace portfolio {

Position::Position()
    : premium_(0.0), openFee_(0.0), closeFee_(0.0),
      openDate_(std::chrono::system_clock::now()) {}

Position::Position(const common::Option& option, double premium, double openFee,
                   double closeFee, std::chrono::system_clock::time_point openDate)
    : option_(option), premium_(premium), openFee_(openFee), closeFee_(closeFee),
      openDate_(openDate) {}

common::Result<std::vector<common::Option>> Position::getOptions() const {
    return std::vector<common::Option>{option_};
}

common::Result<bool> Position::validate() const {
    if (premium_ < 0.0) {
        return common::makeError<bool>(common::ErrorCode::INVALID_PRICE, "premium cannot be negative");
    }
    if (openFee_ < 0.0 || closeFee_ < 0.0) {
        return common::makeError<bool>(common::ErrorCode::INVALID_PRICE, "fees cannot be negative");
    }
    return option_.validate();
}

// Long legs pay the premium; both sides pay fees.
double Position::totalCost() const {
    const double fees = (openFee_ + closeFee_) * option_.quantity;
    if (isLong()) {
        return premium_ * option_.quantity + fees;
    }
    return fees;
}

double Position::premiumReceived() const {
    return isShort() ? premium_ * option_.quantity : 0.0;
}

double Position::netCost() const {
    return totalCost() - premiumReceived();
}

common::Result<double> Position::theoreticalValue() const {
    auto price = math::pricing::blackScholesPrice(option_);
    if (!common::isSuccess(price)) {
        return price;
    }
    return common::getValue(price) * option_.quantity;
}

bool Position::matches(double strike, common::OptionStyle style, common::Side side) const {
    return option_.matches(strike, style, side);
}

std::ostream& operator<<(std::ostream& os, const Position& position) {
    os << position.getOption() << " premium=" << position.getPremium()
       << " fees=" << position.getOpenFee() << "/" << position.getCloseFee();
    return os;
}

}

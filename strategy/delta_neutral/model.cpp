/*
 * Filename: model.cpp
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

#include "strategy/delta_neutral/model.hpp"
#include <iomanip>

namespace strategy {

SameSize::SameSize(const DeltaAdjustment& first, const DeltaAdjustment& second)
    : first(std::make_unique<DeltaAdjustment>(first)),
      second(std::make_unique<DeltaAdjustment>(second)) {}

namespace {

std::unique_ptr<DeltaAdjustment> cloneChild(const std::unique_ptr<DeltaAdjustment>& child) {
    return child ? std::make_unique<DeltaAdjustment>(*child) : nullptr;
}

}

SameSize::SameSize(const SameSize& other)
    : first(cloneChild(other.first)), second(cloneChild(other.second)) {}

SameSize::SameSize(SameSize&& other) noexcept = default;

SameSize& SameSize::operator=(const SameSize& other) {
    if (this != &other) {
        first = cloneChild(other.first);
        second = cloneChild(other.second);
    }
    return *this;
}

SameSize& SameSize::operator=(SameSize&& other) noexcept = default;

SameSize::~SameSize() = default;

DeltaAdjustment DeltaAdjustment::buyOptions(double quantity, double strike,
                                            common::OptionStyle style, common::Side side) {
    return DeltaAdjustment(BuyOptions{quantity, strike, style, side});
}

DeltaAdjustment DeltaAdjustment::sellOptions(double quantity, double strike,
                                             common::OptionStyle style, common::Side side) {
    return DeltaAdjustment(SellOptions{quantity, strike, style, side});
}

DeltaAdjustment DeltaAdjustment::buyUnderlying(double quantity) {
    return DeltaAdjustment(BuyUnderlying{quantity});
}

DeltaAdjustment DeltaAdjustment::sellUnderlying(double quantity) {
    return DeltaAdjustment(SellUnderlying{quantity});
}

DeltaAdjustment DeltaAdjustment::noAdjustmentNeeded() {
    return DeltaAdjustment(NoAdjustmentNeeded{});
}

DeltaAdjustment DeltaAdjustment::sameSize(const DeltaAdjustment& first,
                                          const DeltaAdjustment& second) {
    return DeltaAdjustment(SameSize(first, second));
}

namespace {

template<typename Trade>
bool sameTrade(const Trade& a, const Trade& b) {
    return a.quantity == b.quantity && a.strike == b.strike &&
           a.optionStyle == b.optionStyle && a.side == b.side;
}

bool sameChild(const std::unique_ptr<DeltaAdjustment>& a, const std::unique_ptr<DeltaAdjustment>& b) {
    if (!a || !b) {
        return !a && !b;
    }
    return *a == *b;
}

void printChild(std::ostream& os, const std::unique_ptr<DeltaAdjustment>& child) {
    if (child) {
        os << *child;
    } else {
        os << "<empty>";
    }
}

void printTrade(std::ostream& os, const char* verb, double quantity, double strike,
                common::OptionStyle style, common::Side side) {
    os << verb << " " << quantity << " " << side << " " << style << " @ " << strike;
}

}

bool DeltaAdjustment::operator==(const DeltaAdjustment& other) const {
    if (value_.index() != other.value_.index()) {
        return false;
    }
    if (is<BuyOptions>()) {
        return sameTrade(as<BuyOptions>(), other.as<BuyOptions>());
    }
    if (is<SellOptions>()) {
        return sameTrade(as<SellOptions>(), other.as<SellOptions>());
    }
    if (is<BuyUnderlying>()) {
        return as<BuyUnderlying>().quantity == other.as<BuyUnderlying>().quantity;
    }
    if (is<SellUnderlying>()) {
        return as<SellUnderlying>().quantity == other.as<SellUnderlying>().quantity;
    }
    if (is<SameSize>()) {
        const auto& lhs = as<SameSize>();
        const auto& rhs = other.as<SameSize>();
        return sameChild(lhs.first, rhs.first) && sameChild(lhs.second, rhs.second);
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const DeltaAdjustment& adjustment) {
    if (adjustment.is<BuyOptions>()) {
        const auto& trade = adjustment.as<BuyOptions>();
        printTrade(os, "BuyOptions", trade.quantity, trade.strike, trade.optionStyle, trade.side);
    } else if (adjustment.is<SellOptions>()) {
        const auto& trade = adjustment.as<SellOptions>();
        printTrade(os, "SellOptions", trade.quantity, trade.strike, trade.optionStyle, trade.side);
    } else if (adjustment.is<BuyUnderlying>()) {
        os << "BuyUnderlying " << adjustment.as<BuyUnderlying>().quantity;
    } else if (adjustment.is<SellUnderlying>()) {
        os << "SellUnderlying " << adjustment.as<SellUnderlying>().quantity;
    } else if (adjustment.is<SameSize>()) {
        const auto& pair = adjustment.as<SameSize>();
        os << "SameSize(";
        printChild(os, pair.first);
        os << ", ";
        printChild(os, pair.second);
        os << ")";
    } else {
        os << "NoAdjustmentNeeded";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const DeltaPositionInfo& info) {
    os << info.side << " " << info.optionStyle << " @ " << info.strike
       << " qty=" << info.quantity << " delta=" << info.delta
       << " perContract=" << info.deltaPerContract;
    return os;
}

std::ostream& operator<<(std::ostream& os, const DeltaInfo& info) {
    const auto flags = os.flags();
    const auto precision = os.precision();
    os << std::fixed << std::setprecision(6);
    os << "Net Delta: " << info.netDelta << "\n"
       << "Is Neutral: " << (info.isNeutral ? "true" : "false") << "\n"
       << "Neutrality Threshold: " << info.neutralityThreshold << "\n"
       << "Underlying Price: " << info.underlyingPrice << "\n"
       << "Individual Deltas:\n";
    for (const auto& leg : info.individualDeltas) {
        os << "  " << leg << "\n";
    }
    os.flags(flags);
    os.precision(precision);
    return os;
}

}

/*
 * Filename: model.hpp
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
#include "common/types.hpp"
#include <cstddef>
#include <memory>
#include <ostream>
#include <variant>
#include <vector>

namespace strategy {

constexpr double DELTA_THRESHOLD = 0.0001;

class DeltaAdjustment;

struct BuyOptions {
    double quantity = 0.0;
    double strike = 0.0;
    common::OptionStyle optionStyle = common::OptionStyle::CALL;
    common::Side side = common::Side::LONG;
};

struct SellOptions {
    double quantity = 0.0;
    double strike = 0.0;
    common::OptionStyle optionStyle = common::OptionStyle::CALL;
    common::Side side = common::Side::LONG;
};

struct BuyUnderlying {
    double quantity = 0.0;
};

struct SellUnderlying {
    double quantity = 0.0;
};

struct NoAdjustmentNeeded {};

// Two trades that only make sense together. Both children are owned.
struct SameSize {
    std::unique_ptr<DeltaAdjustment> first;
    std::unique_ptr<DeltaAdjustment> second;

    SameSize(const DeltaAdjustment& first, const DeltaAdjustment& second);
    SameSize(const SameSize& other);
    SameSize(SameSize&& other) noexcept;
    SameSize& operator=(const SameSize& other);
    SameSize& operator=(SameSize&& other) noexcept;
    ~SameSize();
};

class DeltaAdjustment {
public:
    using Variant = std::variant<BuyOptions, SellOptions, BuyUnderlying, SellUnderlying,
                                 NoAdjustmentNeeded, SameSize>;

private:
    Variant value_;

public:
    DeltaAdjustment() : value_(NoAdjustmentNeeded{}) {}
    DeltaAdjustment(Variant value) : value_(std::move(value)) {}

    static DeltaAdjustment buyOptions(double quantity, double strike, common::OptionStyle style,
                                      common::Side side);
    static DeltaAdjustment sellOptions(double quantity, double strike, common::OptionStyle style,
                                       common::Side side);
    static DeltaAdjustment buyUnderlying(double quantity);
    static DeltaAdjustment sellUnderlying(double quantity);
    static DeltaAdjustment noAdjustmentNeeded();
    static DeltaAdjustment sameSize(const DeltaAdjustment& first, const DeltaAdjustment& second);

    const Variant& value() const { return value_; }

    template<typename T>
    bool is() const { return std::holds_alternative<T>(value_); }

    template<typename T>
    const T& as() const { return std::get<T>(value_); }

    bool isOptionTrade() const { return is<BuyOptions>() || is<SellOptions>(); }

    bool operator==(const DeltaAdjustment& other) const;
    bool operator!=(const DeltaAdjustment& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const DeltaAdjustment& adjustment);

struct DeltaPositionInfo {
    double delta = 0.0;
    double deltaPerContract = 0.0;
    double quantity = 0.0;
    double strike = 0.0;
    common::OptionStyle optionStyle = common::OptionStyle::CALL;
    common::Side side = common::Side::LONG;
};

struct DeltaInfo {
    double netDelta = 0.0;
    std::vector<DeltaPositionInfo> individualDeltas;
    bool isNeutral = false;
    double neutralityThreshold = DELTA_THRESHOLD;
    double underlyingPrice = 0.0;
};

std::ostream& operator<<(std::ostream& os, const DeltaPositionInfo& info);
std::ostream& operator<<(std::ostream& os, const DeltaInfo& info);

struct AdjustmentReport {
    std::vector<DeltaAdjustment> applied;
    std::size_t skipped = 0;
    std::vector<common::Error> failures;
    bool neutral = false;
};

}

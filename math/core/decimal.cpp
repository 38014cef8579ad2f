/*
 * Filename: decimal.cpp
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

#include "decimal.hpp"
#include <cmath>
#include <sstream>

namespace math::core::decimal {

namespace {

common::Error conversionError(const char* from, const char* to, double value) {
    std::ostringstream ss;
    ss << "failed to convert " << from << " to " << to << " (value " << value << ")";
    return common::Error(common::ErrorCode::CONVERSION_ERROR, ss.str());
}

}

common::Result<double> toF64(Real value) {
    if (std::isnan(value)) {
        return conversionError("Decimal", "f64", value);
    }
    return static_cast<double>(value);
}

common::Result<Real> fromF64(double value) {
    if (!std::isfinite(value)) {
        return conversionError("f64", "Decimal", value);
    }
    return static_cast<Real>(value);
}

common::Result<Real> exp(Real value) {
    return fromF64(std::exp(value));
}

common::Result<Real> ln(Real value) {
    if (value <= 0.0) {
        return conversionError("Decimal", "ln(Decimal)", value);
    }
    return fromF64(std::log(value));
}

common::Result<Real> sqrt(Real value) {
    if (value < 0.0) {
        return conversionError("Decimal", "sqrt(Decimal)", value);
    }
    return fromF64(std::sqrt(value));
}

common::Result<Real> powTwo(Real value) {
    return fromF64(value * value);
}

Real roundTo(Real value, int places) {
    const Real factor = std::pow(10.0, places);
    return std::round(value * factor) / factor;
}

bool approxEqual(Real a, Real b, Real tolerance) {
    return std::abs(a - b) <= tolerance;
}

}

/*
 * Filename: greeks.cpp
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

#include "greeks.hpp"
#include <iomanip>

namespace common {

Greeks Greeks::operator+(const Greeks& other) const {
    Greeks result = *this;
    result += other;
    return result;
}

Greeks Greeks::operator-(const Greeks& other) const {
    Greeks result = *this;
    result -= other;
    return result;
}

Greeks Greeks::operator*(double multiplier) const {
    Greeks result = *this;
    result *= multiplier;
    return result;
}

// alpha is a ratio of the aggregated gamma and theta, so it is carried
// through unchanged by the arithmetic operators.
Greeks& Greeks::operator+=(const Greeks& other) {
    delta += other.delta;
    gamma += other.gamma;
    theta += other.theta;
    vega += other.vega;
    rho += other.rho;
    rhoD += other.rhoD;
    return *this;
}

Greeks& Greeks::operator-=(const Greeks& other) {
    delta -= other.delta;
    gamma -= other.gamma;
    theta -= other.theta;
    vega -= other.vega;
    rho -= other.rho;
    rhoD -= other.rhoD;
    return *this;
}

Greeks& Greeks::operator*=(double multiplier) {
    delta *= multiplier;
    gamma *= multiplier;
    theta *= multiplier;
    vega *= multiplier;
    rho *= multiplier;
    rhoD *= multiplier;
    return *this;
}

std::ostream& operator<<(std::ostream& os, const Greeks& greeks) {
    const auto flags = os.flags();
    const auto precision = os.precision();
    os << std::fixed << std::setprecision(6)
       << "Greeks{delta=" << greeks.delta
       << ", gamma=" << greeks.gamma
       << ", theta=" << greeks.theta
       << ", vega=" << greeks.vega
       << ", rho=" << greeks.rho
       << ", rhoD=" << greeks.rhoD
       << ", alpha=" << greeks.alpha << "}";
    os.flags(flags);
    os.precision(precision);
    return os;
}

}

/*
 * Filename: greeks.hpp
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

#include <ostream>

namespace common {

struct Greeks {
    double delta = 0.0;
    double gamma = 0.0;
    double theta = 0.0;
    double vega = 0.0;
    double rho = 0.0;
    double rhoD = 0.0;
    double alpha = 0.0;

    Greeks() = default;
    Greeks(double d, double g, double t, double v, double r, double rd, double a)
        : delta(d), gamma(g), theta(t), vega(v), rho(r), rhoD(rd), alpha(a) {}

    Greeks operator+(const Greeks& other) const;
    Greeks operator-(const Greeks& other) const;
    Greeks operator*(double multiplier) const;
    Greeks& operator+=(const Greeks& other);
    Greeks& operator-=(const Greeks& other);
    Greeks& operator*=(double multiplier);
};

std::ostream& operator<<(std::ostream& os, const Greeks& greeks);

}

/*
 * Filename: decimal.hpp
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

#include "types.hpp"
#include "common/result.hpp"

namespace math::core::decimal {

// Boundary checks for values handed to or taken back from floating point
// libraries. NaN never crosses in either direction; infinities may go in
// (the normal CDF saturates) but never come back out.
common::Result<double> toF64(Real value);
common::Result<Real> fromF64(double value);

common::Result<Real> exp(Real value);
common::Result<Real> ln(Real value);
common::Result<Real> sqrt(Real value);
common::Result<Real> powTwo(Real value);

Real roundTo(Real value, int places);
bool approxEqual(Real a, Real b, Real tolerance = TOLERANCE);

}

/*
 * Filename: types.hpp
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

namespace math::core {

    using Real = double;

    constexpr Real INV_SQRT_2PI = 0.39894228040143267794;

    constexpr Real EPSILON = 1e-15;
    constexpr Real TOLERANCE = 1e-8;

    constexpr Real DAYS_IN_YEAR = 365.0;

} // namespace math::core

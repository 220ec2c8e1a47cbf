//
// logsum - Numerically stable log-space sums
// Copyright (c) 2009-2018 Illumina, Inc.
//
// This program is free software: you can redistribute it and/or modify
// it under the terms of the GNU General Public License as published by
// the Free Software Foundation, either version 3 of the License, or
// at your option) any later version.
//
// This program is distributed in the hope that it will be useful,
// but WITHOUT ANY WARRANTY; without even the implied warranty of
// MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
// GNU General Public License for more details.
//
// You should have received a copy of the GNU General Public License
// along with this program.  If not, see <http://www.gnu.org/licenses/>.
//
//

/// \file
/// \brief Low-level floating point helpers shared by the log-space sum utilities
///

#pragma once

#include "boost/math/special_functions/log1p.hpp"

#include <cmath>

#include <limits>
#include <type_traits>


/// Returns log(1+exp(x))
///
/// Accurate for x near zero and for large negative x. Returns exactly 0 for x=-inf and inf for x=inf.
///
template <typename FloatType>
FloatType
log1p_exp(const FloatType x)
{
    static_assert(std::is_floating_point<FloatType>::value, "Requires floating point type.");

    if (std::isnan(x)) return x;

    // log(1+exp(x)) == x + log(1+exp(-x)), so only exp() of a non-positive value is ever taken:
    if (x > 0) return x + boost::math::log1p(std::exp(-x));
    return boost::math::log1p(std::exp(x));
}


/// Positive infinity for \p FloatType
///
template <typename FloatType>
FloatType
posInf()
{
    return std::numeric_limits<FloatType>::infinity();
}


/// Negative infinity for \p FloatType, the log-space representation of zero
///
template <typename FloatType>
FloatType
negInf()
{
    return -std::numeric_limits<FloatType>::infinity();
}

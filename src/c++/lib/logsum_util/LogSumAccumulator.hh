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
/// \brief Single-pass log(exp(x_1)+exp(x_2)+....exp(x_n)) accumulator
///

#pragma once

#include "logsum_util/math_util.hh"

#include <cmath>
#include <cstdint>

#include <iostream>
#include <type_traits>


/// Online log-space sum utility
///
/// Holds the largest value observed so far (max) and the sum of exp(x_i-max) over all values observed so far (sum),
/// the log-space sum is max+log(sum). The sum is rescaled whenever a new max is observed, so no value is ever
/// exponentiated relative to anything but the current max.
///
/// Special values:
/// - an empty accumulator, or one which has only observed -inf, has a log-space sum of -inf
/// - once +inf is observed the log-space sum is +inf
/// - once nan is observed the log-space sum is nan, and all later observations are ignored
///
/// This is based on the online softmax normalizer of Milakov and Gimelshein (arXiv:1805.02867), extended to handle
/// infinite and nan values at any point in the sequence.
///
template <typename FloatType>
struct LogSumAccumulator
{
    static_assert(std::is_floating_point<FloatType>::value, "Requires floating point type.");

    typedef FloatType value_type;

    void
    addObservation(const FloatType x)
    {
        _count++;
        if (isNan()) return;

        if (std::isnan(x))
        {
            _max = x;
            return;
        }

        if (_max == negInf<FloatType>())
        {
            if (x == negInf<FloatType>()) return;
            _max = x;
            _sum = 1;
        }
        else if (x <= _max)
        {
            // nothing is added to an infinite max, this also avoids computing inf-inf:
            if (_max == posInf<FloatType>()) return;
            _sum += std::exp(x - _max);
        }
        else
        {
            if (x == posInf<FloatType>())
            {
                _sum = 1;
            }
            else
            {
                _sum = _sum * std::exp(_max - x) + 1;
            }
            _max = x;
        }
    }

    /// Combine with the accumulated observations of \p rhs
    ///
    /// The result matches (to rounding error) a single accumulator which observed both input sequences.
    ///
    void
    merge(const LogSumAccumulator& rhs)
    {
        _count += rhs._count;
        if (isNan()) return;

        if (rhs.isNan())
        {
            _max = rhs._max;
            return;
        }

        if (rhs._max == negInf<FloatType>()) return;

        if (_max == negInf<FloatType>())
        {
            _max = rhs._max;
            _sum = rhs._sum;
        }
        else if ((_max == posInf<FloatType>()) || (rhs._max == posInf<FloatType>()))
        {
            _max = posInf<FloatType>();
            _sum = 1;
        }
        else if (rhs._max > _max)
        {
            _sum = _sum * std::exp(_max - rhs._max) + rhs._sum;
            _max = rhs._max;
        }
        else
        {
            _sum += rhs._sum * std::exp(rhs._max - _max);
        }
    }

    /// Returns log(exp(x_1)+exp(x_2)+....exp(x_n)) over all observations
    FloatType
    getLogSum() const
    {
        if (empty()) return negInf<FloatType>();
        if (isNan() || std::isinf(_max)) return _max;
        return _max + std::log(_sum);
    }

    FloatType
    getMax() const
    {
        return _max;
    }

    /// sum of exp(x_i-max), this is only meaningful when max is finite
    FloatType
    getSum() const
    {
        return _sum;
    }

    /// total number of observations, including any ignored after a nan
    uint64_t
    count() const
    {
        return _count;
    }

    bool
    empty() const
    {
        return (_count==0);
    }

    bool
    isNan() const
    {
        return std::isnan(_max);
    }

    void
    clear()
    {
        _max = negInf<FloatType>();
        _sum = 0;
        _count = 0;
    }

private:
    FloatType _max = negInf<FloatType>();
    FloatType _sum = 0;
    uint64_t _count = 0;
};


template <typename FloatType>
std::ostream&
operator<<(std::ostream& os, const LogSumAccumulator<FloatType>& lsa)
{
    os << "count: " << lsa.count() << " max: " << lsa.getMax() << " sum: " << lsa.getSum()
       << " logSum: " << lsa.getLogSum();
    return os;
}

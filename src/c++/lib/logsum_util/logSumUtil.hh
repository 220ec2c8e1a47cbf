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
/// \brief Various utilities for taking sums in log-space
///

#pragma once

#include "common/Exceptions.hh"
#include "logsum_util/LogSumAccumulator.hh"
#include "logsum_util/math_util.hh"

#include <cmath>

#include <initializer_list>
#include <iterator>
#include <type_traits>
#include <utility>


/// Returns the equivalent of log(exp(x1)+exp(x2))
///
/// nan in either argument returns nan, otherwise inf in either argument returns inf.
///
template <typename FloatType>
FloatType
getLogSum(FloatType x1, FloatType x2)
{
    static_assert(std::is_floating_point<FloatType>::value, "Requires floating point type.");

    // nan must be screened before the comparison below, which is always false for nan:
    if (std::isnan(x1)) return x1;
    if (std::isnan(x2)) return x2;

    if (x1<x2) std::swap(x1,x2);

    // x1 is inf, or x1 and x2 are both -inf:
    if (std::isinf(x1)) return x1;
    return x1 + log1p_exp(x2-x1);
}


/// Returns the equivalent of log(exp(x_1)+exp(x_2)+....exp(x_n))
///
/// The sequence is read once in order, so any input iterator can be used. Iteration stops early if a nan is found.
///
/// An empty sequence returns -inf.
///
template <typename IterType>
typename std::iterator_traits<IterType>::value_type
getLogSumSequence(
    IterType beginIter,
    const IterType endIter)
{
    typedef typename std::iterator_traits<IterType>::value_type value_type;
    static_assert(std::is_floating_point<value_type>::value, "Requires iterator on floating point type.");

    LogSumAccumulator<value_type> lsa;
    for (; beginIter != endIter; ++beginIter)
    {
        lsa.addObservation(*beginIter);
        if (lsa.isNan()) break;
    }
    return lsa.getLogSum();
}


/// Returns the equivalent of log(exp(x_1)+exp(x_2)+....exp(x_n)), where x_1..x_n are all elements in \p container
///
template <typename ContainerType>
auto
getLogSumSequence(
    const ContainerType& container) -> typename std::iterator_traits<decltype(std::begin(container))>::value_type
{
    return getLogSumSequence(std::begin(container), std::end(container));
}


template <typename FloatType>
FloatType
getLogSumSequence(
    std::initializer_list<FloatType> ilist)
{
    return getLogSumSequence(std::begin(ilist), std::end(ilist));
}


/// Returns the equivalent of log((exp(x_1)+exp(x_2)+....exp(x_n))/n) over all observations in \p lsa
///
/// This is the mean of a set of values which are stored in log-space, such as probabilities.
///
/// \throws PreConditionException for an empty accumulator
///
template <typename FloatType>
FloatType
getLogMean(
    const LogSumAccumulator<FloatType>& lsa)
{
    if (lsa.empty())
    {
        using namespace logsum::common;
        BOOST_THROW_EXCEPTION(PreConditionException("Log-space mean is undefined for an empty sequence"));
    }

    return lsa.getLogSum() - std::log(static_cast<FloatType>(lsa.count()));
}


/// Returns the equivalent of log((exp(x_1)+exp(x_2)+....exp(x_n))/n)
///
/// \throws PreConditionException for an empty sequence
///
template <typename IterType>
typename std::iterator_traits<IterType>::value_type
getLogMeanSequence(
    IterType beginIter,
    const IterType endIter)
{
    typedef typename std::iterator_traits<IterType>::value_type value_type;
    static_assert(std::is_floating_point<value_type>::value, "Requires iterator on floating point type.");

    LogSumAccumulator<value_type> lsa;
    for (; beginIter != endIter; ++beginIter)
    {
        lsa.addObservation(*beginIter);
    }
    return getLogMean(lsa);
}


template <typename ContainerType>
auto
getLogMeanSequence(
    const ContainerType& container) -> typename std::iterator_traits<decltype(std::begin(container))>::value_type
{
    return getLogMeanSequence(std::begin(container), std::end(container));
}

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

///
/// \author Chris Saunders
///

#pragma once

#include "LogSumExpOptions.hh"

#include "common/Exceptions.hh"
#include "logsum_util/LogSumAccumulator.hh"
#include "logsum_util/LogValueReader.hh"
#include "logsum_util/log.hh"
#include "logsum_util/logSumUtil.hh"

#include <cstdint>

#include <iostream>
#include <sstream>
#include <string>


/// sum all values from \p is into a new accumulator
///
template <typename FloatType>
LogSumAccumulator<FloatType>
accumulateLogValues(
    std::istream& is,
    const std::string& inputName)
{
    LogValueReader<FloatType> reader(is, inputName);
    LogSumAccumulator<FloatType> lsa;

    // all values are read after a nan to validate the rest of the input:
    while (reader.next())
    {
        lsa.addObservation(reader.getValue());
    }

    if (lsa.isNan())
    {
        log_os << "WARNING: input '" << inputName << "' contains nan values\n";
    }
    return lsa;
}


/// result for one accumulator in sum or mean mode
///
template <typename FloatType>
FloatType
getModeResult(
    const LOG_SUM_MODE::index_t mode,
    const LogSumAccumulator<FloatType>& lsa)
{
    if (mode == LOG_SUM_MODE::MEAN) return getLogMean(lsa);
    return lsa.getLogSum();
}


/// write log(exp(a)+exp(b)) to \p os for each consecutive pair of values (a,b) in \p is
///
/// \return number of pairs reported
///
template <typename FloatType>
uint64_t
reportPairwiseLogSums(
    std::istream& is,
    const std::string& inputName,
    std::ostream& os)
{
    LogValueReader<FloatType> reader(is, inputName);
    uint64_t pairCount(0);
    while (reader.next())
    {
        const FloatType a(reader.getValue());
        if (! reader.next())
        {
            std::ostringstream oss;
            oss << "Pairwise mode requires an even number of values, found " << reader.getValueCount()
                << " values in input '" << inputName << "'";
            BOOST_THROW_EXCEPTION(logsum::common::InvalidParameterException(oss.str()));
        }
        os << getLogSum(a, reader.getValue()) << '\n';
        pairCount++;
    }
    return pairCount;
}


/// run the reduction described by \p opt, writing results to \p os
///
void
runLogSumExp(
    const LogSumExpOptions& opt,
    std::ostream& os);

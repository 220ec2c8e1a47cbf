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

#include <string>
#include <vector>


namespace LOG_SUM_MODE
{
enum index_t
{
    SUM,
    MEAN,
    PAIRWISE,
    SIZE
};

inline
const char*
label(const unsigned idx)
{
    switch (idx)
    {
    case SUM:
        return "sum";
    case MEAN:
        return "mean";
    case PAIRWISE:
        return "pairwise";
    default:
        return "unknown";
    }
}
}


namespace FLOAT_PRECISION
{
enum index_t
{
    FLOAT,
    DOUBLE,
    SIZE
};

inline
const char*
label(const unsigned idx)
{
    switch (idx)
    {
    case FLOAT:
        return "float";
    case DOUBLE:
        return "double";
    default:
        return "unknown";
    }
}
}


struct LogSumExpOptions
{
    /// input filenames, "-" is stdin
    std::vector<std::string> inputFilenames;

    std::string precisionLabel = FLOAT_PRECISION::label(FLOAT_PRECISION::DOUBLE);
    std::string modeLabel = LOG_SUM_MODE::label(LOG_SUM_MODE::SUM);

    /// set from the labels above when the options are finalized:
    FLOAT_PRECISION::index_t precision = FLOAT_PRECISION::DOUBLE;
    LOG_SUM_MODE::index_t mode = LOG_SUM_MODE::SUM;

    /// report the result for each input in addition to the merged result for all inputs
    bool isPerInputReport = false;

    std::string cmdline;
};

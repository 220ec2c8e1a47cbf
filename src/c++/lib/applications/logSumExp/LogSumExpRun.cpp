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

#include "LogSumExpRun.hh"

#include <cerrno>

#include <fstream>
#include <iomanip>
#include <limits>



/// get the stream for \p inputFilename, which is stdin for "-"
///
static
std::istream&
openInput(
    const std::string& inputFilename,
    std::ifstream& ifs)
{
    if (inputFilename == "-") return std::cin;

    ifs.open(inputFilename.c_str());
    if (! ifs)
    {
        using namespace logsum::common;
        std::ostringstream oss;
        oss << "Failed to open input file '" << inputFilename << "'";
        BOOST_THROW_EXCEPTION(IoException(errno, oss.str()));
    }
    return ifs;
}



template <typename FloatType>
static
void
runLogSumExpPrecision(
    const LogSumExpOptions& opt,
    std::ostream& os)
{
    os << std::setprecision(std::numeric_limits<FloatType>::max_digits10);

    if (opt.mode == LOG_SUM_MODE::PAIRWISE)
    {
        for (const std::string& inputFilename : opt.inputFilenames)
        {
            std::ifstream ifs;
            reportPairwiseLogSums<FloatType>(openInput(inputFilename,ifs), inputFilename, os);
        }
        return;
    }

    // each input is reduced separately and merged into the total:
    LogSumAccumulator<FloatType> total;
    for (const std::string& inputFilename : opt.inputFilenames)
    {
        std::ifstream ifs;
        const LogSumAccumulator<FloatType> inputLsa(
            accumulateLogValues<FloatType>(openInput(inputFilename,ifs), inputFilename));

        if (opt.isPerInputReport)
        {
            os << inputFilename << '\t' << getModeResult(opt.mode, inputLsa) << '\n';
        }
        total.merge(inputLsa);
    }

    os << getModeResult(opt.mode, total) << '\n';
}



void
runLogSumExp(
    const LogSumExpOptions& opt,
    std::ostream& os)
{
    if (opt.precision == FLOAT_PRECISION::FLOAT)
    {
        runLogSumExpPrecision<float>(opt, os);
    }
    else
    {
        runLogSumExpPrecision<double>(opt, os);
    }
}

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

#include "common/Program.hh"

#include "boost/program_options.hpp"

#include <string>


boost::program_options::options_description
getLogSumExpOptionsParser(
    LogSumExpOptions& opt);


/// convert option labels to their enumerated values after the boost::program_options parse
///
/// \return true if an error was found, in which case \p errorMsg describes it
bool
finalizeLogSumExpOptions(
    const boost::program_options::variables_map& vm,
    LogSumExpOptions& opt,
    std::string& errorMsg);


/// parse command-line into \p opt, print usage and exit for any option errors
void
parseLogSumExpOptions(
    const logsum::Program& prog,
    int argc, char* argv[],
    LogSumExpOptions& opt);

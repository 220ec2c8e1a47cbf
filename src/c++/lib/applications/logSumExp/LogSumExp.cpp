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

#include "LogSumExp.hh"
#include "LogSumExpOptionsParser.hh"
#include "LogSumExpRun.hh"

#include "logsum_util/log.hh"



void
LogSumExp::
runInternal(int argc, char* argv[]) const
{
    LogSumExpOptions opt;

    parseLogSumExpOptions(*this,argc,argv,opt);
    runLogSumExp(opt, report_os);
}

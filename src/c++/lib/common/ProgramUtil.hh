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

#include "common/Program.hh"

#include "boost/program_options.hpp"

#include <iosfwd>


/// print standard program usage to \p os and exit
///
/// \param desc one line program description
/// \param afterdesc text following "[options]" in the usage line, describing positional arguments
/// \param msg optional error message, the program exits with an error status when this is provided
///
void
usage(
    std::ostream& os,
    const logsum::Program& prog,
    const boost::program_options::options_description& visible,
    const char* desc,
    const char* afterdesc,
    const char* msg = nullptr);

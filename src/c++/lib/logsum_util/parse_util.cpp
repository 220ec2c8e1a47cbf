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
///
/// \author Chris Saunders
///

#include "logsum_util/parse_util.hh"
#include "logsum_util/logsum_exception.hh"

#include <cerrno>
#include <cstddef>
#include <cmath>
#include <cstdlib>

#include <sstream>



static
void
parse_exception(
    const char* type_label,
    const char* parse_str)
{
    std::ostringstream oss;
    oss << "ERROR: Can't parse " << type_label << " from string: '" << parse_str << "'";
    throw logsum_exception(oss.str().c_str());
}



/// check the whole string was consumed by the parse:
static
void
check_parse_end(
    const char* type_label,
    const std::string& s,
    const char* endptr)
{
    if ((endptr-s.c_str())!=static_cast<std::ptrdiff_t>(s.length()))
    {
        parse_exception(type_label,s.c_str());
    }
}



namespace logsum
{
namespace logsum_util
{

double
parse_double(const char*& s)
{
    errno = 0;

    char* endptr;
    const double val(strtod(s, &endptr));

    // underflow is allowed to round to zero or a subnormal, overflow is not:
    if (((errno == ERANGE) && (std::abs(val) == HUGE_VAL)) || (endptr == s))
    {
        parse_exception("double",s);
    }

    s = endptr;
    return val;
}



float
parse_float(const char*& s)
{
    errno = 0;

    char* endptr;
    const float val(strtof(s, &endptr));
    if (((errno == ERANGE) && (std::abs(val) == HUGE_VALF)) || (endptr == s))
    {
        parse_exception("float",s);
    }

    s = endptr;
    return val;
}



double
parse_double_str(const std::string& s)
{
    const char* s2(s.c_str());
    const double val(parse_double(s2));
    check_parse_end("double",s,s2);
    return val;
}



float
parse_float_str(const std::string& s)
{
    const char* s2(s.c_str());
    const float val(parse_float(s2));
    check_parse_end("float",s,s2);
    return val;
}

}
}

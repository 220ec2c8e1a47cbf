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

#pragma once

#include <string>


namespace logsum
{
namespace logsum_util
{

/// parse TYPE from char* with several error checks, and advance
/// pointer to end of TYPE input
///
/// Infinite and nan values ("inf", "-inf", "nan", "infinity") are accepted, a finite
/// value which is out of range for TYPE is an error.
///
double
parse_double(const char*& s);

float
parse_float(const char*& s);



/// std::string version of above, no ptr advance obviously. explicit rename
/// of functions guards against unexpected std::string temporaries
///
/// The entire string must be consumed by the parse.
///
double
parse_double_str(const std::string& s);

float
parse_float_str(const std::string& s);



/// template version of the std::string parsers:
///
template <typename T>
T
parse_type_str(const std::string& s);

template <>
inline
double
parse_type_str<double>(const std::string& s)
{
    return parse_double_str(s);
}

template <>
inline
float
parse_type_str<float>(const std::string& s)
{
    return parse_float_str(s);
}

}
}

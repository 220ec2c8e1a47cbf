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
/// \brief Reads a whitespace separated stream of log-space values
///

#pragma once

#include "common/Exceptions.hh"
#include "logsum_util/logsum_exception.hh"
#include "logsum_util/parse_util.hh"

#include <cerrno>
#include <cstdint>

#include <istream>
#include <sstream>
#include <string>


/// Parse one value at a time from a text stream of whitespace separated values
///
/// Values are parsed with the logsum_util string parsers, so inf, -inf and nan are accepted.
///
template <typename FloatType>
struct LogValueReader
{
    LogValueReader(
        std::istream& is,
        const std::string& inputName)
        : _is(is)
        , _inputName(inputName)
    {}

    /// read the next value
    ///
    /// \return false for the regular end of input
    bool
    next()
    {
        using namespace logsum::common;

        if (! (_is >> _word))
        {
            if (_is.bad())
            {
                std::ostringstream oss;
                oss << "Unexpected failure while reading value " << (_valueCount+1) << " from input '" << _inputName << "'";
                BOOST_THROW_EXCEPTION(IoException(EIO, oss.str()));
            }
            return false;
        }

        _valueCount++;
        try
        {
            _value = logsum::logsum_util::parse_type_str<FloatType>(_word);
        }
        catch (const logsum_exception&)
        {
            std::ostringstream oss;
            oss << "Can't parse log value " << _valueCount << " from input '" << _inputName << "': '" << _word << "'";
            BOOST_THROW_EXCEPTION(InvalidParameterException(oss.str()));
        }
        return true;
    }

    /// the value found by the last successful call to next()
    FloatType
    getValue() const
    {
        return _value;
    }

    uint64_t
    getValueCount() const
    {
        return _valueCount;
    }

    const std::string&
    getInputName() const
    {
        return _inputName;
    }

private:
    std::istream& _is;
    const std::string _inputName;
    std::string _word;
    FloatType _value = 0;
    uint64_t _valueCount = 0;
};

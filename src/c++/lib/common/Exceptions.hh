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

/**
 ** \file
 ** \brief Declaration of the common exception mechanism.
 **
 ** The numeric log-space utilities never throw for any floating point
 ** input. These exceptions cover misuse of the utilities and the failures
 ** of the programs built on them, such as unreadable input.
 **/

#pragma once

#include "boost/exception/all.hpp"
#include "boost/throw_exception.hpp"

#include <ios>
#include <stdexcept>
#include <string>

namespace logsum
{
namespace common
{

/**
 ** \brief Virtual base class to all the exception classes
 **
 ** Use BOOST_THROW_EXCEPTION to get the context info (file, function, line)
 ** at the throw site.
 **/
class ExceptionData : public boost::exception
{
public:
    ExceptionData(int errorNumber=0, const std::string& message="");
    ExceptionData(const ExceptionData&) = default;
    ExceptionData& operator=(const ExceptionData&) = delete;

    int getErrorNumber() const
    {
        return errorNumber_;
    }
    const std::string& getMessage() const
    {
        return message_;
    }

    /// time, errno description and throw site, for the last-chance error report
    std::string getContext() const;
private:
    const int errorNumber_;
    const std::string message_;
};

/**
 * \brief Exception thrown when an input stream cannot be opened or read
 */
class IoException: public std::ios_base::failure, public ExceptionData
{
public:
    IoException(int errorNumber, const std::string& message);
};

/**
 ** \brief Exception thrown when input data cannot be used, such as a log value which does not parse
 **/
class InvalidParameterException: public std::logic_error, public ExceptionData
{
public:
    explicit
    InvalidParameterException(const std::string& message);
};

/**
 ** \brief Exception thrown when a method invocation violates the pre-conditions.
 **/
class PreConditionException: public std::logic_error, public ExceptionData
{
public:
    explicit
    PreConditionException(const std::string& message);
};

}
}

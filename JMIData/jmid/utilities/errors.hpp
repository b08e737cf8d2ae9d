/*
 Copyright (C) 2026 JMI Developers
 All rights reserved.

 This file is part of JMI, a free-software/open-source library
 for market-implied rate and credit analytics.

 JMI is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file jmid/utilities/errors.hpp
    \brief Typed errors raised by the market data adapter and the models
    \ingroup utilities
*/

#pragma once

#include <boost/current_function.hpp>
#include <ql/errors.hpp>
#include <sstream>
#include <string>

namespace jmi {
namespace data {

/*! Malformed or missing raw market data fields, e.g. a duplicate OIS tenor or a bond quote with a
    non-finite yield.
    \ingroup utilities
*/
class DataValidationError : public QuantLib::Error {
public:
    using QuantLib::Error::Error;
};

//! Degenerate tenor input, e.g. no OIS tenor beyond the policy meeting
class InvalidTenorError : public QuantLib::Error {
public:
    using QuantLib::Error::Error;
};

//! Degenerate policy step size, i.e. zero or of the wrong sign
class InvalidStepSizeError : public QuantLib::Error {
public:
    using QuantLib::Error::Error;
};

//! No upcoming policy meeting in the configured calendar
class MissingMeetingError : public QuantLib::Error {
public:
    using QuantLib::Error::Error;
};

//! An issuer was requested for which there are no bond quotes
class UnknownIssuerError : public QuantLib::Error {
public:
    using QuantLib::Error::Error;
};

//! A government yield was requested outside the curve's maturity range
class CurveLookupError : public QuantLib::Error {
public:
    using QuantLib::Error::Error;
};

} // namespace data
} // namespace jmi

/*! \def JMI_FAIL
    \brief throw a typed error with the given message, see QL_FAIL
*/
#define JMI_FAIL(errorType, message)                                                                                   \
    do {                                                                                                               \
        std::ostringstream _jmi_msg_stream;                                                                            \
        _jmi_msg_stream << message;                                                                                    \
        throw errorType(__FILE__, __LINE__, BOOST_CURRENT_FUNCTION, _jmi_msg_stream.str());                            \
    } while (false)

/*! \def JMI_REQUIRE
    \brief throw a typed error if the given condition is not verified, see QL_REQUIRE
*/
#define JMI_REQUIRE(condition, errorType, message)                                                                     \
    if (!(condition)) {                                                                                                \
        std::ostringstream _jmi_msg_stream;                                                                            \
        _jmi_msg_stream << message;                                                                                    \
        throw errorType(__FILE__, __LINE__, BOOST_CURRENT_FUNCTION, _jmi_msg_stream.str());                            \
    } else

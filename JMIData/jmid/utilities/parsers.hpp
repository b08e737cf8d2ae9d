/*
 Copyright (C) 2016 Quaternion Risk Management Ltd
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

/*! \file jmid/utilities/parsers.hpp
    \brief string converion utilities
    \ingroup utilities
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/time/period.hpp>
#include <ql/types.hpp>
#include <string>
#include <vector>

namespace jmi {
namespace data {
using QuantLib::Date;
using QuantLib::Integer;
using QuantLib::Real;
using std::string;

//! Convert text to QuantLib::Date
/*!
  The following formats are accepted
  - yyyy-mm-dd
  - yyyy/mm/dd
  - yyyymmdd (also given as an integer, as in the JSDA reference files)
  \ingroup utilities
 */
Date parseDate(const string& s);

//! Convert text to Real
/*!
  \ingroup utilities
 */
Real parseReal(const string& s);

//! Attempt to convert text to Real
/*! Attempts to convert text to Real
    \param[in]  s      The string we wish to convert to a Real
    \param[out] result The result of the conversion if it is valid.
                       Null<Real>() if conversion fails

    \return True if the conversion was successful, False if not

    \ingroup utilities
 */
bool tryParseReal(const string& s, QuantLib::Real& result);

//! Convert text to QuantLib::Integer
/*!
  \ingroup utilities
 */
Integer parseInteger(const string& s);

//! Convert text to bool
/*!
  \ingroup utilities
 */
bool parseBool(const string& s);

//! Convert text to QuantLib::Period
/*!
  Accepts a single signed number followed by a unit D, W, M or Y, e.g. 1D, 3M, -1W.
  \ingroup utilities
 */
QuantLib::Period parsePeriod(const string& s);

//! Convert an OIS tenor label to a number of calendar days from \p asof
/*!
  A plain integer is taken as a day count. Otherwise the label is parsed as a period and
  - D counts days, W counts 7 days,
  - M and Y count the calendar days between \p asof and \p asof advanced by the period.

  The result may be negative; it is the caller's responsibility to reject it.
  \ingroup utilities
 */
Integer parseTenorDays(const string& s, const Date& asof);

//! Convert a tenor label to a year fraction for charting
/*! A plain integer and D count days over 365, W counts 7 days over 365, M counts twelfths and Y counts years.
    \ingroup utilities
 */
Real parseTenorYears(const string& s);

//! Convert comma separated list of values to vector of values
/*!
  \ingroup utilities
 */
std::vector<string> parseListOfValues(string s);

} // namespace data
} // namespace jmi

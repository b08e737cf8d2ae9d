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

#include <jmid/utilities/parsers.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <ql/errors.hpp>
#include <ql/utilities/null.hpp>

#include <algorithm>
#include <cctype>
#include <map>

using namespace QuantLib;
using namespace std;

namespace jmi {
namespace data {

namespace {
Date makeDate(const string& y, const string& m, const string& d, const string& s) {
    try {
        Year year = boost::lexical_cast<Year>(y);
        Month month = static_cast<Month>(boost::lexical_cast<Integer>(m));
        Day day = boost::lexical_cast<Day>(d);
        return Date(day, month, year);
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Cannot convert \"" << s << "\" to Date.");
    }
}
} // namespace

Date parseDate(const string& s) {
    string str = boost::trim_copy(s);
    QL_REQUIRE(!str.empty(), "Cannot convert empty string to Date");

    // yyyy-mm-dd or yyyy/mm/dd
    if (str.size() == 10 && (str[4] == '-' || str[4] == '/') && str[7] == str[4]) {
        return makeDate(str.substr(0, 4), str.substr(5, 2), str.substr(8, 2), str);
    }

    // yyyymmdd, possibly written as a real number by a spreadsheet export, e.g. 20251031.0
    string digits = str;
    if (digits.size() > 8 && digits.find('.') == 8 &&
        digits.find_first_not_of('0', 9) == string::npos)
        digits = digits.substr(0, 8);
    if (digits.size() == 8 &&
        std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return makeDate(digits.substr(0, 4), digits.substr(4, 2), digits.substr(6, 2), str);
    }

    QL_FAIL("Cannot convert \"" << s << "\" to Date.");
}

Real parseReal(const string& s) {
    try {
        return boost::lexical_cast<Real>(boost::trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parseReal(\"" << s << "\")");
    }
}

bool tryParseReal(const string& s, QuantLib::Real& result) {
    try {
        result = boost::lexical_cast<Real>(boost::trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        result = Null<Real>();
        return false;
    }
    return true;
}

Integer parseInteger(const string& s) {
    try {
        return boost::lexical_cast<Integer>(boost::trim_copy(s));
    } catch (const boost::bad_lexical_cast&) {
        QL_FAIL("Failed to parseInteger(\"" << s << "\")");
    }
}

bool parseBool(const string& s) {
    static const map<string, bool> b = {{"Y", true},     {"YES", true},    {"TRUE", true},   {"True", true},
                                        {"true", true},  {"1", true},      {"N", false},     {"NO", false},
                                        {"FALSE", false}, {"False", false}, {"false", false}, {"0", false}};

    auto it = b.find(boost::trim_copy(s));
    if (it != b.end()) {
        return it->second;
    } else {
        QL_FAIL("Cannot convert \"" << s << "\" to bool");
    }
}

Period parsePeriod(const string& s) {
    string str = boost::to_upper_copy(boost::trim_copy(s));
    QL_REQUIRE(str.size() >= 2, "Cannot convert \"" << s << "\" to Period.");

    Integer n = parseInteger(str.substr(0, str.size() - 1));
    switch (str.back()) {
    case 'D':
        return Period(n, Days);
    case 'W':
        return Period(n, Weeks);
    case 'M':
        return Period(n, Months);
    case 'Y':
        return Period(n, Years);
    default:
        QL_FAIL("Unknown time unit '" << str.back() << "' in period \"" << s << "\"");
    }
}

Integer parseTenorDays(const string& s, const Date& asof) {
    Integer days;
    if (boost::conversion::try_lexical_convert(boost::trim_copy(s), days))
        return days;

    Period p = parsePeriod(s);
    switch (p.units()) {
    case Days:
        return p.length();
    case Weeks:
        return 7 * p.length();
    case Months:
    case Years:
        QL_REQUIRE(asof != Date(), "parseTenorDays: an as of date is required to convert \"" << s << "\" to days");
        return (asof + p) - asof;
    default:
        QL_FAIL("parseTenorDays: unexpected time unit in \"" << s << "\"");
    }
}

Real parseTenorYears(const string& s) {
    Integer days;
    if (boost::conversion::try_lexical_convert(boost::trim_copy(s), days))
        return days / 365.0;

    Period p = parsePeriod(s);
    switch (p.units()) {
    case Days:
        return p.length() / 365.0;
    case Weeks:
        return 7.0 * p.length() / 365.0;
    case Months:
        return p.length() / 12.0;
    case Years:
        return static_cast<Real>(p.length());
    default:
        QL_FAIL("parseTenorYears: unexpected time unit in \"" << s << "\"");
    }
}

std::vector<string> parseListOfValues(string s) {
    boost::trim(s);
    std::vector<string> vec;
    if (s.empty())
        return vec;
    boost::split(vec, s, boost::is_any_of(","), boost::token_compress_off);
    for (auto& v : vec)
        boost::trim(v);
    return vec;
}

} // namespace data
} // namespace jmi

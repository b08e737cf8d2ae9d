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

/*! \file jmid/report/report.hpp
    \brief Report interface class
    \ingroup report
*/

#pragma once

#include <boost/variant.hpp>
#include <ql/time/date.hpp>
#include <ql/types.hpp>
#include <string>

namespace jmi {
namespace data {
using QuantLib::Date;
using QuantLib::Real;
using QuantLib::Size;
using std::string;

/*! Abstract Report interface class
 *
 *  A Report can be thought of as a CSV file or SQL table, it has columns (each with a name and type) which
 *  are set before we add any data, then each row of data is added with calls to add().
 *
 *  ReportType is a boost::variant which covers all the allowable types for a report.
 *
 *  Usage of the report API is as follows
 *  <pre>
 *   Report pd_report = makeReport();
 *
 *   // create headers
 *   pd_report.addColumn("IssuerId", string())
 *            .addColumn("PD5Y", double(), 6)
 *            .addColumn("Bonds", Size());
 *
 *   // add rows
 *   pd_report.next().add("A").add(0.0541).add(Size(3));
 *   pd_report.next().add("B").add(0.0213).add(Size(1));
 *   pd_report.end();
 *   </pre>
  \ingroup report
 */
class Report {
public:
    typedef boost::variant<Size, Real, string, Date> ReportType;

    virtual ~Report() {}
    virtual Report& addColumn(const string& name, const ReportType&, Size precision = 0) = 0;
    virtual Report& next() = 0;
    virtual Report& add(const ReportType& rt) = 0;
    virtual void end() = 0;
    // make sure that (possibly) buffered output data is written to the result object (e.g. a file)
    virtual void flush() {}
};
} // namespace data
} // namespace jmi

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

#include <jmid/report/csvreport.hpp>
#include <jmid/report/inmemoryreport.hpp>

#include <boost/algorithm/string/join.hpp>
#include <ql/errors.hpp>

namespace jmi {
namespace data {

Report& InMemoryReport::addColumn(const string& name, const ReportType& rt, Size precision) {
    headers_.push_back(name);
    columnTypes_.push_back(rt);
    columnPrecision_.push_back(precision);
    data_.push_back(vector<ReportType>()); // Initialise vector for column
    i_++;
    return *this;
}

Report& InMemoryReport::next() {
    QL_REQUIRE(i_ == headers_.size(), "Cannot go to next line, only " << i_ << " entries filled, report headers are: "
                                                                      << boost::join(headers_, ","));
    i_ = 0;
    return *this;
}

Report& InMemoryReport::add(const ReportType& rt) {
    // check type is valid
    QL_REQUIRE(i_ < headers_.size(), "No column to add [" << rt << "] to.");
    QL_REQUIRE(rt.which() == columnTypes_[i_].which(), "Cannot add value "
                                                           << rt << " of type " << rt.which() << " to column "
                                                           << headers_[i_] << " of type " << columnTypes_[i_].which()
                                                           << ", report headers are: " << boost::join(headers_, ","));

    data_[i_].push_back(rt);
    i_++;
    return *this;
}

void InMemoryReport::end() {
    QL_REQUIRE(i_ == headers_.size() || i_ == 0, "report is finalized with incomplete row, got data for "
                                                     << i_ << " columns out of " << columns()
                                                     << ", report headers are: " << boost::join(headers_, ","));
}

Size InMemoryReport::columnIndex(const string& h) const {
    auto it = std::find(headers_.begin(), headers_.end(), h);
    QL_REQUIRE(it != headers_.end(), "report has no column " << h << ", report headers are: "
                                                             << boost::join(headers_, ","));
    return static_cast<Size>(it - headers_.begin());
}

const vector<Report::ReportType>& InMemoryReport::data(Size i) const {
    QL_REQUIRE(i < data_.size(), "report has no column " << i << ", it has " << data_.size() << " columns");
    return data_[i];
}

const Report::ReportType& InMemoryReport::data(Size i, Size j) const {
    const vector<ReportType>& column = data(i);
    QL_REQUIRE(j < column.size(), "report column " << i << " (" << header(i) << ") has no row " << j);
    return column[j];
}

void InMemoryReport::toFile(const string& filename, const char sep, const bool commentCharacter, char quoteChar,
                            const string& nullString, bool lowerHeader) {

    CSVFileReport cReport(filename, sep, commentCharacter, quoteChar, nullString, lowerHeader);

    for (Size i = 0; i < headers_.size(); i++) {
        cReport.addColumn(headers_[i], columnTypes_[i], columnPrecision_[i]);
    }

    for (Size i = 0; i < rows(); i++) {
        cReport.next();
        for (Size j = 0; j < columns(); j++) {
            cReport.add(data_[j][i]);
        }
    }

    cReport.end();
}

} // namespace data
} // namespace jmi

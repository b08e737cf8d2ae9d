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

/*! \file jmid/marketdata/rawmarketdata.hpp
    \brief Raw market data as delivered by the data store
    \ingroup marketdata
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/types.hpp>
#include <string>
#include <vector>

namespace jmi {
namespace data {

//! OIS quote as published, e.g. {"3M", 0.475} with the rate in percent
struct RawOisQuote {
    std::string tenor;
    QuantLib::Real rate;
};

//! One line of a JSDA reference price file
struct RawBondRecord {
    QuantLib::Date tradeDate;
    QuantLib::Integer category;
    std::string issueCode;
    std::string name;
    QuantLib::Date maturity;
    QuantLib::Real coupon;
    QuantLib::Real yield;
};

//! Explicit government curve point, maturity in years
struct RawCurvePoint {
    QuantLib::Real maturityYears;
    QuantLib::Real yield;
};

//! Everything one evaluation cycle consumes
/*! If \c governmentCurve is empty the curve is built from the government bonds among the \c bondRecords.
    \c dataVersion labels the snapshot built from this data, it defaults to the source date.
 */
struct RawMarketData {
    QuantLib::Date sourceDate;
    std::string dataVersion;
    std::vector<RawOisQuote> oisQuotes;
    std::vector<QuantLib::Date> meetingDates;
    std::vector<RawBondRecord> bondRecords;
    std::vector<RawCurvePoint> governmentCurve;
};

} // namespace data
} // namespace jmi

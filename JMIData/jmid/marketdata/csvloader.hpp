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

/*! \file jmid/marketdata/csvloader.hpp
    \brief Loader for OIS and JSDA bond files
    \ingroup marketdata
*/

#pragma once

#include <jmid/marketdata/rawmarketdata.hpp>

#include <string>

namespace jmi {
namespace data {

//! Utility class for loading raw market data from files
/*!
  Data is loaded with the call to the constructor, the raw market data can then be retrieved with data().

  The OIS file has a header line <tt>tenor,rate</tt> followed by one quote per line, e.g. <tt>3M,0.475</tt>.
  The bond file is a JSDA reference price file without header, with the columns trade date, category, issue code,
  name, maturity date, coupon and yield, further columns are ignored. JSDA publishes the file in CP932 (Shift_JIS),
  each line is converted from the given encoding to UTF-8 with Boost.Locale. A UTF-8 file is read as is.
  Yields of 999 or more mark a missing price and these records are skipped.

  Blank lines and lines starting with '#' are skipped in both files.

  \ingroup marketdata
 */
class CSVLoader {
public:
    CSVLoader() {}

    CSVLoader( //! OIS quote file name
        const std::string& oisFilename,
        //! JSDA bond file name, may be empty
        const std::string& bondFilename,
        //! Source date of the data, taken from the first bond record if not given
        const QuantLib::Date& sourceDate = QuantLib::Date(),
        //! Character set of the bond file
        const std::string& bondFileEncoding = "CP932");

    const RawMarketData& data() const { return data_; }

    //! Threshold at or above which a JSDA yield is a placeholder for a missing price
    static constexpr QuantLib::Real missingYield = 999.0;

private:
    void loadOisFile(const std::string& filename);
    void loadBondFile(const std::string& filename, const std::string& encoding);

    RawMarketData data_;
};

} // namespace data
} // namespace jmi

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

/*! \file jmid/marketdata/marketdataadapter.hpp
    \brief Validation and normalisation of raw market data
    \ingroup marketdata
*/

#pragma once

#include <jmid/configuration/marketdataconfig.hpp>
#include <jmid/marketdata/governmentcurve.hpp>
#include <jmid/marketdata/marketdatum.hpp>
#include <jmid/marketdata/rawmarketdata.hpp>

#include <ql/shared_ptr.hpp>
#include <vector>

namespace jmi {
namespace data {

//! Validated inputs of one evaluation cycle
struct MarketInputs {
    Date sourceDate;
    string dataVersion;
    std::vector<OISQuote> oisQuotes;
    PolicyMeeting meeting;
    std::vector<BondQuote> bondQuotes;
    QuantLib::ext::shared_ptr<GovernmentCurve> governmentCurve;
};

//! Market data adapter
/*!
  Turns the raw data of the data store into the typed inputs of the models. The adapter holds no state besides its
  configuration, all member functions are pure.

  Rates and yields are converted from percent to decimal form if the configuration says they are quoted in percent.
  Any OIS quote with a negative tenor, a non-finite rate or a duplicate tenor, and any bond quote with a
  non-positive maturity or a non-finite yield is rejected with a DataValidationError. A missing policy meeting
  raises a MissingMeetingError.

  \ingroup marketdata
*/
class MarketDataAdapter {
public:
    /*! \param config       quote and bond classification conventions
        \param expectedStep the signed policy step assumed for the next meeting
     */
    explicit MarketDataAdapter(const MarketDataConfig& config = MarketDataConfig(), Real expectedStep = 0.0025);

    //! OIS quotes sorted by tenor, tenor labels are resolved against \p sourceDate
    std::vector<OISQuote> oisQuotes(const std::vector<RawOisQuote>& raw, const Date& sourceDate) const;

    //! The first meeting on or after \p sourceDate
    PolicyMeeting nextMeeting(const std::vector<Date>& meetingDates, const Date& sourceDate) const;

    //! Corporate bond quotes, records that are not corporate bonds are ignored
    std::vector<BondQuote> bondQuotes(const std::vector<RawBondRecord>& records, const Date& sourceDate) const;

    //! Government curve from explicit curve points if given, otherwise from the government bond records
    QuantLib::ext::shared_ptr<GovernmentCurve> governmentCurve(const RawMarketData& raw) const;

    //! Run all of the above
    MarketInputs adapt(const RawMarketData& raw) const;

    //! \name Classification of JSDA records
    //@{
    bool isGovernmentBond(const RawBondRecord& record) const;
    bool isCorporateBond(const RawBondRecord& record) const;
    //@}

    //! \name Validation of already typed data
    //@{
    static void validate(const std::vector<OISQuote>& quotes);
    static void validate(const std::vector<BondQuote>& quotes);
    //@}

    const MarketDataConfig& config() const { return config_; }

private:
    Real yearsToMaturity(const RawBondRecord& record, const Date& sourceDate) const;

    MarketDataConfig config_;
    Real expectedStep_;
};

} // namespace data
} // namespace jmi

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

/*! \file jmid/marketdata/marketdatum.hpp
    \brief Validated market data consumed by the models
    \ingroup marketdata
*/

#pragma once

#include <ql/time/date.hpp>
#include <ql/types.hpp>
#include <string>

namespace jmi {
namespace data {
using QuantLib::Date;
using QuantLib::Integer;
using QuantLib::Real;
using QuantLib::Size;
using std::string;

//! OIS quote
/*!
  This class holds a single point of an OIS curve, the tenor in calendar days from the market date and the
  annualised rate in decimal form.

  \ingroup marketdata
*/
class OISQuote {
public:
    OISQuote() : tenorDays_(0), rate_(0.0) {}
    OISQuote(Integer tenorDays, Real rate) : tenorDays_(tenorDays), rate_(rate) {}

    //! \name Inspectors
    //@{
    Integer tenorDays() const { return tenorDays_; }
    Real rate() const { return rate_; }
    //@}

private:
    Integer tenorDays_;
    Real rate_;
};

//! Policy meeting
/*!
  The next scheduled policy decision, with the number of calendar days from the market date to the meeting
  (\f$ D_{pre} \f$) and the signed step size \f$ \Delta \f$ the market is assumed to price.

  \ingroup marketdata
*/
class PolicyMeeting {
public:
    PolicyMeeting() : daysUntil_(0), expectedStep_(0.0) {}
    PolicyMeeting(const Date& date, Integer daysUntil, Real expectedStep)
        : date_(date), daysUntil_(daysUntil), expectedStep_(expectedStep) {}

    //! \name Inspectors
    //@{
    const Date& date() const { return date_; }
    Integer daysUntil() const { return daysUntil_; }
    Real expectedStep() const { return expectedStep_; }
    //@}

private:
    Date date_;
    Integer daysUntil_;
    Real expectedStep_;
};

//! Corporate bond quote
/*!
  Yield in decimal form and time to maturity in years of one outstanding bond of an issuer.

  \ingroup marketdata
*/
class BondQuote {
public:
    BondQuote() : maturityYears_(0.0), yield_(0.0) {}
    BondQuote(const string& issuerId, Real maturityYears, Real yield, const string& issueCode = "")
        : issuerId_(issuerId), maturityYears_(maturityYears), yield_(yield), issueCode_(issueCode) {}

    //! \name Inspectors
    //@{
    const string& issuerId() const { return issuerId_; }
    Real maturityYears() const { return maturityYears_; }
    Real yield() const { return yield_; }
    //! Empty if the quote does not come from a coded bond record
    const string& issueCode() const { return issueCode_; }
    //@}

private:
    string issuerId_;
    Real maturityYears_;
    Real yield_;
    string issueCode_;
};

//! Government benchmark curve point
class GovernmentCurvePoint {
public:
    GovernmentCurvePoint() : maturityYears_(0.0), yield_(0.0) {}
    GovernmentCurvePoint(Real maturityYears, Real yield) : maturityYears_(maturityYears), yield_(yield) {}

    Real maturityYears() const { return maturityYears_; }
    Real yield() const { return yield_; }

private:
    Real maturityYears_;
    Real yield_;
};

} // namespace data
} // namespace jmi

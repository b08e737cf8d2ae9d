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

/*! \file jmid/metrics/curvesample.hpp
    \brief Curves sampled at tenor points for charting
    \ingroup metrics
*/

#pragma once

#include <jmid/marketdata/governmentcurve.hpp>
#include <jmid/marketdata/rawmarketdata.hpp>

#include <string>
#include <vector>

namespace jmi {
namespace data {

//! Rate of a curve at one tenor point
struct CurveSample {
    CurveSample() : years(0.0), rate(0.0) {}
    CurveSample(const std::string& tenor, Real years, Real rate) : tenor(tenor), years(years), rate(rate) {}

    std::string tenor;
    Real years;
    //! Decimal rate
    Real rate;
};

bool operator==(const CurveSample& lhs, const CurveSample& rhs);

//! 1D, 1W, 2W, 1M, 2M, 3M, 6M, 9M, 1Y to 5Y, 7Y, 10Y, 15Y, 20Y, 30Y and 40Y
const std::vector<std::string>& standardCurveTenors();

//! The OIS quotes as a curve in year fractions, sorted by maturity
/*! Quotes are scaled to decimal rates by \p quoteFactor, tenor labels are converted with parseTenorYears().
    \ingroup metrics
*/
std::vector<CurveSample> oisCurveSamples(const std::vector<RawOisQuote>& quotes, Real quoteFactor);

//! The government curve interpolated at \p tenors
/*! Tenors outside the maturity range of the curve are skipped, the curve is never extrapolated.
    \ingroup metrics
*/
std::vector<CurveSample> sampleGovernmentCurve(const GovernmentCurve& curve,
                                               const std::vector<std::string>& tenors = standardCurveTenors());

} // namespace data
} // namespace jmi

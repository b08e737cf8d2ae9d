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

/*! \file jmid/metrics/metricssnapshot.hpp
    \brief Immutable result of one evaluation cycle
    \ingroup metrics
*/

#pragma once

#include <jmid/metrics/curvesample.hpp>
#include <jmid/models/creditriskmodel.hpp>
#include <jmid/models/rateprobabilitymodel.hpp>

#include <boost/date_time/posix_time/ptime.hpp>

namespace jmi {
namespace data {

//! Metrics snapshot
/*!
  Holds the rate probabilities and the ranked issuer credit profiles of one evaluation, stamped with the
  evaluation time, together with the OIS curve and the sampled government curve they were computed from.
  A snapshot is never modified, a new evaluation produces a new snapshot.

  \ingroup metrics
*/
class MetricsSnapshot {
public:
    //! The credit profiles are expected to be ranked, see rankByDefaultProbability()
    MetricsSnapshot(const boost::posix_time::ptime& asOf, const Date& marketDate, const string& dataVersion,
                    const RateProbabilityResult& rateResult, const std::vector<IssuerCreditProfile>& creditProfiles,
                    const std::vector<CurveSample>& oisCurve = {},
                    const std::vector<CurveSample>& governmentCurve = {});

    //! \name Inspectors
    //@{
    const boost::posix_time::ptime& asOf() const { return asOf_; }
    const Date& marketDate() const { return marketDate_; }
    const string& dataVersion() const { return dataVersion_; }
    const RateProbabilityResult& rateResult() const { return rateResult_; }
    const std::vector<IssuerCreditProfile>& creditProfiles() const { return creditProfiles_; }
    const std::vector<CurveSample>& oisCurve() const { return oisCurve_; }
    const std::vector<CurveSample>& governmentCurve() const { return governmentCurve_; }
    //@}

    //! Equality of everything but the evaluation time
    bool sameMetrics(const MetricsSnapshot& other) const;

    //! Returns the snapshot as a JSON object
    string json() const;

private:
    const boost::posix_time::ptime asOf_;
    const Date marketDate_;
    const string dataVersion_;
    const RateProbabilityResult rateResult_;
    const std::vector<IssuerCreditProfile> creditProfiles_;
    const std::vector<CurveSample> oisCurve_;
    const std::vector<CurveSample> governmentCurve_;
};

} // namespace data
} // namespace jmi

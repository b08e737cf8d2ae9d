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

#include <jmid/metrics/metricssnapshot.hpp>
#include <jmid/utilities/log.hpp>
#include <jmid/utilities/to_string.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>

#include <iomanip>
#include <sstream>

using std::ostream;
using std::ostringstream;

namespace jmi {
namespace data {

namespace {

ostream& stepJson(ostream& oss, const StepProbability& p) {
    return oss << "{ \"step\": " << p.step << ", \"raw\": " << p.raw << ", \"value\": " << p.value
               << ", \"boundary_hit\": " << to_string(p.boundaryHit) << " }";
}

ostream& profileJson(ostream& oss, const IssuerCreditProfile& p) {
    oss << "{ \"issuer_id\": \"" << jsonify(p.issuerId) << "\", \"n_bonds\": " << p.numberOfBonds
        << ", \"avg_maturity_years\": " << p.avgMaturityYears << ", \"spread\": " << p.spread
        << ", \"hazard_rate\": " << p.hazardRate << ", \"pd_5y\": " << p.pd5y << ", \"pd_curve\": { ";
    bool first = true;
    for (const auto& h : p.pdCurve) {
        oss << (first ? "" : ", ") << "\"" << h.first << "\": " << h.second;
        first = false;
    }
    return oss << " }, \"negative_spread\": " << to_string(p.negativeSpread) << " }";
}

ostream& curveJson(ostream& oss, const std::vector<CurveSample>& curve) {
    oss << "[ ";
    for (Size i = 0; i < curve.size(); ++i)
        oss << (i > 0 ? ", " : "") << "{ \"tenor\": \"" << jsonify(curve[i].tenor)
            << "\", \"years\": " << curve[i].years << ", \"rate\": " << curve[i].rate << " }";
    return oss << " ]";
}

} // namespace

MetricsSnapshot::MetricsSnapshot(const boost::posix_time::ptime& asOf, const Date& marketDate,
                                 const string& dataVersion, const RateProbabilityResult& rateResult,
                                 const std::vector<IssuerCreditProfile>& creditProfiles,
                                 const std::vector<CurveSample>& oisCurve,
                                 const std::vector<CurveSample>& governmentCurve)
    : asOf_(asOf), marketDate_(marketDate), dataVersion_(dataVersion), rateResult_(rateResult),
      creditProfiles_(creditProfiles), oisCurve_(oisCurve), governmentCurve_(governmentCurve) {}

bool MetricsSnapshot::sameMetrics(const MetricsSnapshot& other) const {
    return marketDate_ == other.marketDate_ && dataVersion_ == other.dataVersion_ &&
           rateResult_ == other.rateResult_ && creditProfiles_ == other.creditProfiles_ &&
           oisCurve_ == other.oisCurve_ && governmentCurve_ == other.governmentCurve_;
}

string MetricsSnapshot::json() const {
    const RateProbabilityResult& r = rateResult_;
    ostringstream oss;
    oss << std::setprecision(16);
    oss << "{ \"as_of\": \"" << boost::posix_time::to_iso_extended_string(asOf_) << "\", \"market_date\": \""
        << to_string(marketDate_) << "\", \"data_version\": \"" << jsonify(dataVersion_) << "\",";
    oss << " \"rate_result\": { \"meeting_date\": \"" << to_string(r.meetingDate)
        << "\", \"days_to_meeting\": " << r.daysToMeeting << ", \"days_post\": " << r.daysPost
        << ", \"current_rate\": " << r.currentRate << ", \"post_rate\": " << r.postRate
        << ", \"implied_rate\": " << r.impliedRate << ", \"p_no_change\": " << r.pNoChange()
        << ", \"p_hike\": " << r.pHike() << ", \"p_cut\": " << r.pCut() << ", \"hike\": ";
    stepJson(oss, r.hike) << ", \"cut\": ";
    stepJson(oss, r.cut) << ", \"no_change\": ";
    stepJson(oss, r.noChange) << ", \"p_no_change_independent\": " << r.pNoChangeIndependent
                              << ", \"no_change_discrepancy\": " << to_string(r.noChangeDiscrepancy) << " },";
    oss << " \"credit_profiles\": [ ";
    for (Size i = 0; i < creditProfiles_.size(); ++i) {
        if (i > 0)
            oss << ", ";
        profileJson(oss, creditProfiles_[i]);
    }
    oss << " ], \"ois_curve\": ";
    curveJson(oss, oisCurve_) << ", \"government_curve\": ";
    curveJson(oss, governmentCurve_) << " }";
    return oss.str();
}

} // namespace data
} // namespace jmi

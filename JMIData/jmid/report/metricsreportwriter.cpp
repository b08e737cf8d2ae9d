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

#include <jmid/report/metricsreportwriter.hpp>
#include <jmid/utilities/log.hpp>
#include <jmid/utilities/to_string.hpp>

#include <boost/date_time/posix_time/posix_time.hpp>
#include <ql/errors.hpp>
#include <ql/math/comparison.hpp>

#include <fstream>
#include <set>

using QuantLib::Real;
using QuantLib::Size;
using std::string;

namespace jmi {
namespace data {

namespace {
struct CloseLess {
    bool operator()(Real a, Real b) const { return a < b && !QuantLib::close_enough(a, b); }
};
} // namespace

void MetricsReportWriter::writeRateProbabilities(Report& report, const MetricsSnapshot& snapshot) {
    const RateProbabilityResult& r = snapshot.rateResult();
    LOG("Writing rate probability report for meeting " << to_string(r.meetingDate));

    report.addColumn("AsOf", string())
        .addColumn("MarketDate", Date())
        .addColumn("MeetingDate", Date())
        .addColumn("DaysToMeeting", Size())
        .addColumn("DaysPost", Size())
        .addColumn("CurrentRate", double(), 6)
        .addColumn("PostRate", double(), 6)
        .addColumn("ImpliedRate", double(), 6)
        .addColumn("Scenario", string())
        .addColumn("Step", double(), 6)
        .addColumn("RawProbability", double(), 6)
        .addColumn("Probability", double(), 6)
        .addColumn("BoundaryHit", string());

    std::vector<std::pair<string, const StepProbability*>> scenarios = {
        {"Hike", &r.hike}, {"Cut", &r.cut}, {"NoChange", &r.noChange}};
    for (const auto& s : scenarios) {
        report.next()
            .add(boost::posix_time::to_iso_extended_string(snapshot.asOf()))
            .add(snapshot.marketDate())
            .add(r.meetingDate)
            .add(static_cast<Size>(r.daysToMeeting))
            .add(static_cast<Size>(r.daysPost))
            .add(r.currentRate)
            .add(r.postRate)
            .add(r.impliedRate)
            .add(s.first)
            .add(s.second->step)
            .add(s.second->raw)
            .add(s.second->value)
            .add(to_string(s.second->boundaryHit));
    }
    report.end();
}

void MetricsReportWriter::writeCreditProfiles(Report& report, const MetricsSnapshot& snapshot) {
    const std::vector<IssuerCreditProfile>& profiles = snapshot.creditProfiles();
    LOG("Writing credit profile report for " << profiles.size() << " issuers");

    std::set<Real, CloseLess> horizons;
    for (const auto& p : profiles)
        for (const auto& h : p.pdCurve)
            horizons.insert(h.first);

    report.addColumn("Rank", Size())
        .addColumn("IssuerId", string())
        .addColumn("Bonds", Size())
        .addColumn("AvgMaturityYears", double(), 4)
        .addColumn("Spread", double(), 6)
        .addColumn("HazardRate", double(), 6)
        .addColumn("PD5Y", double(), 6);
    for (auto h : horizons)
        report.addColumn("PD_" + to_string(h) + "Y", double(), 6);
    report.addColumn("NegativeSpread", string());

    for (Size i = 0; i < profiles.size(); ++i) {
        const IssuerCreditProfile& p = profiles[i];
        report.next()
            .add(i + 1)
            .add(p.issuerId)
            .add(p.numberOfBonds)
            .add(p.avgMaturityYears)
            .add(p.spread)
            .add(p.hazardRate)
            .add(p.pd5y);
        for (auto h : horizons) {
            auto it = p.pdCurve.find(h);
            report.add(it != p.pdCurve.end() ? it->second : p.defaultProbability(h));
        }
        report.add(to_string(p.negativeSpread));
    }
    report.end();
}

void MetricsReportWriter::writeCurves(Report& report, const MetricsSnapshot& snapshot) {
    LOG("Writing curves, " << snapshot.oisCurve().size() << " OIS and " << snapshot.governmentCurve().size()
                           << " government points");

    report.addColumn("Curve", string())
        .addColumn("Tenor", string())
        .addColumn("Years", double(), 6)
        .addColumn("Rate", double(), 8);

    std::vector<std::pair<string, const std::vector<CurveSample>*>> curves = {
        {"OIS", &snapshot.oisCurve()}, {"JGB", &snapshot.governmentCurve()}};
    for (const auto& c : curves) {
        for (const auto& s : *c.second)
            report.next().add(c.first).add(s.tenor).add(s.years).add(s.rate);
    }
    report.end();
}

void MetricsReportWriter::writeJson(const std::string& filename, const MetricsSnapshot& snapshot) {
    LOG("Writing snapshot " << snapshot.dataVersion() << " to " << filename);
    std::ofstream file(filename.c_str());
    QL_REQUIRE(file.is_open(), "error opening file " << filename);
    file << snapshot.json() << std::endl;
    QL_REQUIRE(file.good(), "error writing file " << filename);
    file.close();
}

} // namespace data
} // namespace jmi

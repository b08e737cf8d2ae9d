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

#include <jmid/marketdata/issuername.hpp>
#include <jmid/marketdata/marketdataadapter.hpp>
#include <jmid/utilities/errors.hpp>
#include <jmid/utilities/log.hpp>
#include <jmid/utilities/parsers.hpp>
#include <jmid/utilities/to_string.hpp>

#include <ql/time/daycounters/actual365fixed.hpp>

#include <algorithm>
#include <cmath>
#include <map>
#include <set>

using namespace QuantLib;
using std::vector;

namespace jmi {
namespace data {

MarketDataAdapter::MarketDataAdapter(const MarketDataConfig& config, Real expectedStep)
    : config_(config), expectedStep_(expectedStep) {}

vector<OISQuote> MarketDataAdapter::oisQuotes(const vector<RawOisQuote>& raw, const Date& sourceDate) const {
    vector<OISQuote> quotes;
    for (const auto& q : raw) {
        Integer days;
        try {
            days = parseTenorDays(q.tenor, sourceDate);
        } catch (const std::exception& e) {
            JMI_FAIL(DataValidationError, "invalid OIS tenor '" << q.tenor << "': " << e.what());
        }
        quotes.push_back(OISQuote(days, q.rate * config_.quoteFactor()));
    }
    std::sort(quotes.begin(), quotes.end(),
              [](const OISQuote& a, const OISQuote& b) { return a.tenorDays() < b.tenorDays(); });
    validate(quotes);
    DLOG("MarketDataAdapter: " << quotes.size() << " OIS quotes");
    return quotes;
}

PolicyMeeting MarketDataAdapter::nextMeeting(const vector<Date>& meetingDates, const Date& sourceDate) const {
    JMI_REQUIRE(sourceDate != Date(), DataValidationError, "no source date given, cannot determine the next meeting");
    Date next;
    for (const auto& d : meetingDates) {
        if (d >= sourceDate && (next == Date() || d < next))
            next = d;
    }
    JMI_REQUIRE(next != Date(), MissingMeetingError,
                "no policy meeting on or after " << to_string(sourceDate) << " among " << meetingDates.size()
                                                 << " configured meetings");
    return PolicyMeeting(next, next - sourceDate, expectedStep_);
}

bool MarketDataAdapter::isGovernmentBond(const RawBondRecord& record) const {
    for (const auto& marker : config_.governmentMarkers()) {
        if (record.name.find(marker) != string::npos)
            return true;
    }
    return false;
}

bool MarketDataAdapter::isCorporateBond(const RawBondRecord& record) const {
    return !isGovernmentBond(record) && config_.corporateCategories().count(record.category) > 0;
}

Real MarketDataAdapter::yearsToMaturity(const RawBondRecord& record, const Date& sourceDate) const {
    Date start = record.tradeDate == Date() ? sourceDate : record.tradeDate;
    JMI_REQUIRE(start != Date() && record.maturity != Date(), DataValidationError,
                "bond " << record.issueCode << " (" << record.name << ") has no trade or maturity date");
    return Actual365Fixed().yearFraction(start, record.maturity);
}

vector<BondQuote> MarketDataAdapter::bondQuotes(const vector<RawBondRecord>& records, const Date& sourceDate) const {
    vector<BondQuote> quotes;
    for (const auto& r : records) {
        if (!isCorporateBond(r))
            continue;
        string issuer = extractIssuer(r.name);
        JMI_REQUIRE(!issuer.empty(), DataValidationError,
                    "bond " << r.issueCode << ": no issuer in bond name '" << r.name << "'");
        quotes.push_back(BondQuote(issuer, yearsToMaturity(r, sourceDate), r.yield * config_.quoteFactor(),
                                   r.issueCode));
    }
    validate(quotes);
    DLOG("MarketDataAdapter: " << quotes.size() << " corporate bond quotes");
    return quotes;
}

QuantLib::ext::shared_ptr<GovernmentCurve> MarketDataAdapter::governmentCurve(const RawMarketData& raw) const {
    // yields at equal maturities are averaged
    std::map<Real, std::pair<Real, Size>> buckets;
    auto add = [&buckets](Real t, Real y) {
        auto& b = buckets[t];
        b.first += y;
        b.second += 1;
    };

    if (!raw.governmentCurve.empty()) {
        for (const auto& p : raw.governmentCurve) {
            JMI_REQUIRE(p.maturityYears > 0.0, DataValidationError,
                        "government curve point with non-positive maturity " << p.maturityYears);
            JMI_REQUIRE(std::isfinite(p.yield), DataValidationError,
                        "government curve point at " << p.maturityYears << " years has a non-finite yield");
            add(p.maturityYears, p.yield * config_.quoteFactor());
        }
    } else {
        for (const auto& r : raw.bondRecords) {
            if (!isGovernmentBond(r))
                continue;
            Real t = yearsToMaturity(r, raw.sourceDate);
            JMI_REQUIRE(t > 0.0, DataValidationError,
                        "government bond " << r.issueCode << " has non-positive maturity " << t);
            JMI_REQUIRE(std::isfinite(r.yield), DataValidationError,
                        "government bond " << r.issueCode << " has a non-finite yield");
            add(t, r.yield * config_.quoteFactor());
        }
    }

    vector<GovernmentCurvePoint> points;
    for (const auto& b : buckets)
        points.push_back(GovernmentCurvePoint(b.first, b.second.first / b.second.second));
    JMI_REQUIRE(points.size() >= 2, DataValidationError,
                "government curve needs at least two distinct maturities, got " << points.size());
    DLOG("MarketDataAdapter: government curve with " << points.size() << " points from "
                                                     << (raw.governmentCurve.empty() ? "bond records" : "curve points"));
    return QuantLib::ext::make_shared<GovernmentCurve>(points);
}

MarketInputs MarketDataAdapter::adapt(const RawMarketData& raw) const {
    LOG("MarketDataAdapter: adapting market data of " << to_string(raw.sourceDate));
    MarketInputs inputs;
    inputs.sourceDate = raw.sourceDate;
    inputs.dataVersion = raw.dataVersion.empty() ? to_string(raw.sourceDate) : raw.dataVersion;
    inputs.oisQuotes = oisQuotes(raw.oisQuotes, raw.sourceDate);
    inputs.meeting = nextMeeting(raw.meetingDates, raw.sourceDate);
    inputs.bondQuotes = bondQuotes(raw.bondRecords, raw.sourceDate);
    inputs.governmentCurve = governmentCurve(raw);
    return inputs;
}

void MarketDataAdapter::validate(const vector<OISQuote>& quotes) {
    std::set<Integer> tenors;
    for (const auto& q : quotes) {
        JMI_REQUIRE(q.tenorDays() >= 0, DataValidationError, "OIS quote with negative tenor " << q.tenorDays());
        JMI_REQUIRE(std::isfinite(q.rate()), DataValidationError,
                    "OIS quote at tenor " << q.tenorDays() << " has a non-finite rate");
        JMI_REQUIRE(tenors.insert(q.tenorDays()).second, DataValidationError,
                    "duplicate OIS tenor " << q.tenorDays());
    }
}

void MarketDataAdapter::validate(const vector<BondQuote>& quotes) {
    for (const auto& q : quotes) {
        JMI_REQUIRE(q.maturityYears() > 0.0, DataValidationError,
                    "bond quote " << q.issueCode() << " of " << q.issuerId() << " has non-positive maturity "
                                  << q.maturityYears());
        JMI_REQUIRE(std::isfinite(q.yield()), DataValidationError,
                    "bond quote " << q.issueCode() << " of " << q.issuerId() << " has a non-finite yield");
    }
}

} // namespace data
} // namespace jmi

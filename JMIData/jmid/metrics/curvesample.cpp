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

#include <jmid/metrics/curvesample.hpp>
#include <jmid/utilities/log.hpp>
#include <jmid/utilities/parsers.hpp>

#include <algorithm>

namespace jmi {
namespace data {

bool operator==(const CurveSample& lhs, const CurveSample& rhs) {
    return lhs.tenor == rhs.tenor && lhs.years == rhs.years && lhs.rate == rhs.rate;
}

const std::vector<std::string>& standardCurveTenors() {
    static const std::vector<std::string> tenors = {"1D", "1W", "2W", "1M", "2M",  "3M",  "6M",  "9M",  "1Y", "2Y",
                                                    "3Y", "4Y", "5Y", "7Y", "10Y", "15Y", "20Y", "30Y", "40Y"};
    return tenors;
}

std::vector<CurveSample> oisCurveSamples(const std::vector<RawOisQuote>& quotes, Real quoteFactor) {
    std::vector<CurveSample> samples;
    for (const auto& q : quotes)
        samples.push_back(CurveSample(q.tenor, parseTenorYears(q.tenor), q.rate * quoteFactor));
    std::stable_sort(samples.begin(), samples.end(),
                     [](const CurveSample& a, const CurveSample& b) { return a.years < b.years; });
    return samples;
}

std::vector<CurveSample> sampleGovernmentCurve(const GovernmentCurve& curve, const std::vector<std::string>& tenors) {
    std::vector<CurveSample> samples;
    for (const auto& tenor : tenors) {
        Real t = parseTenorYears(tenor);
        if (t < curve.minMaturity() || t > curve.maxMaturity()) {
            TLOG("sampleGovernmentCurve: tenor " << tenor << " outside the curve range, skipped");
            continue;
        }
        samples.push_back(CurveSample(tenor, t, curve.yield(t)));
    }
    DLOG("sampleGovernmentCurve: " << samples.size() << " of " << tenors.size() << " tenors sampled");
    return samples;
}

} // namespace data
} // namespace jmi

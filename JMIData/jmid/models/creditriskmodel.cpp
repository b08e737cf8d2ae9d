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

#include <jmid/models/creditriskmodel.hpp>
#include <jmid/models/structuredmodelwarning.hpp>
#include <jmid/utilities/errors.hpp>
#include <jmid/utilities/log.hpp>

#include <algorithm>
#include <cmath>

using namespace QuantLib;
using std::vector;

namespace jmi {
namespace data {

Real IssuerCreditProfile::defaultProbability(Real horizon) const {
    return data::defaultProbability(hazardRate, horizon);
}

bool operator==(const IssuerCreditProfile& lhs, const IssuerCreditProfile& rhs) {
    return lhs.issuerId == rhs.issuerId && lhs.numberOfBonds == rhs.numberOfBonds &&
           lhs.avgMaturityYears == rhs.avgMaturityYears && lhs.spread == rhs.spread &&
           lhs.hazardRate == rhs.hazardRate && lhs.pd5y == rhs.pd5y && lhs.pdCurve == rhs.pdCurve &&
           lhs.negativeSpread == rhs.negativeSpread;
}

Real creditSpread(Real corporateYield, Real governmentYield) { return corporateYield - governmentYield; }

Real impliedHazardRate(Real spread, Real recoveryRate) {
    JMI_REQUIRE(recoveryRate >= 0.0 && recoveryRate < 1.0, DataValidationError,
                "recovery rate (" << recoveryRate << ") must be in [0, 1)");
    return std::max(spread, 0.0) / (1.0 - recoveryRate);
}

Real defaultProbability(Real hazardRate, Real horizon) {
    JMI_REQUIRE(horizon >= 0.0, InvalidTenorError, "default probability horizon (" << horizon << ") is negative");
    return 1.0 - std::exp(-hazardRate * horizon);
}

IssuerCreditProfile computeIssuerProfile(const string& issuerId, const vector<BondQuote>& quotes,
                                         const GovernmentCurve& curve, const CreditRiskConfig& config) {
    IssuerCreditProfile profile;
    profile.issuerId = issuerId;

    Size found = 0;
    Real sumSpread = 0.0, sumMaturity = 0.0;
    for (const auto& q : quotes) {
        if (q.issuerId() != issuerId)
            continue;
        ++found;
        Real governmentYield;
        try {
            governmentYield = curve.yield(q.maturityYears());
        } catch (const CurveLookupError& e) {
            if (!config.continueOnError())
                throw;
            StructuredModelWarningMessage("Bond skipped", e.what(), issuerId + " " + q.issueCode()).log();
            continue;
        }
        sumSpread += creditSpread(q.yield(), governmentYield);
        sumMaturity += q.maturityYears();
        ++profile.numberOfBonds;
    }

    JMI_REQUIRE(found > 0, UnknownIssuerError, "no bond quotes for issuer " << issuerId);
    JMI_REQUIRE(profile.numberOfBonds > 0, UnknownIssuerError,
                "no bond of issuer " << issuerId << " matures within the government curve");

    profile.spread = sumSpread / profile.numberOfBonds;
    profile.avgMaturityYears = sumMaturity / profile.numberOfBonds;
    profile.hazardRate = impliedHazardRate(profile.spread, config.recoveryRate());
    profile.negativeSpread = profile.spread < 0.0;
    for (auto h : config.horizons())
        profile.pdCurve[h] = defaultProbability(profile.hazardRate, h);
    profile.pd5y = defaultProbability(profile.hazardRate, CreditRiskConfig::rankingHorizon);

    if (profile.negativeSpread)
        DLOG("CreditRiskModel: negative spread " << profile.spread << " for " << issuerId
                                                  << ", hazard rate set to zero");
    return profile;
}

vector<IssuerCreditProfile> computeCreditProfiles(const vector<BondQuote>& quotes, const GovernmentCurve& curve,
                                                  const CreditRiskConfig& config) {
    std::set<string> issuers;
    for (const auto& q : quotes)
        issuers.insert(q.issuerId());
    return computeCreditProfiles(quotes, curve, config, issuers);
}

vector<IssuerCreditProfile> computeCreditProfiles(const vector<BondQuote>& quotes, const GovernmentCurve& curve,
                                                  const CreditRiskConfig& config, const std::set<string>& issuers) {
    vector<IssuerCreditProfile> profiles;
    for (const auto& issuer : issuers) {
        try {
            profiles.push_back(computeIssuerProfile(issuer, quotes, curve, config));
        } catch (const UnknownIssuerError& e) {
            // only an issuer whose bonds were all skipped is dropped, an issuer without any quote is an error
            bool quoted = std::any_of(quotes.begin(), quotes.end(),
                                      [&issuer](const BondQuote& q) { return q.issuerId() == issuer; });
            if (!config.continueOnError() || !quoted)
                throw;
            StructuredModelWarningMessage("Issuer dropped", e.what(), issuer).log();
        }
    }
    rankByDefaultProbability(profiles);
    LOG("CreditRiskModel: " << profiles.size() << " issuer profiles from " << quotes.size() << " bond quotes");
    return profiles;
}

void rankByDefaultProbability(vector<IssuerCreditProfile>& profiles) {
    std::sort(profiles.begin(), profiles.end(), [](const IssuerCreditProfile& a, const IssuerCreditProfile& b) {
        if (a.pd5y != b.pd5y)
            return a.pd5y > b.pd5y;
        return a.issuerId < b.issuerId;
    });
}

} // namespace data
} // namespace jmi

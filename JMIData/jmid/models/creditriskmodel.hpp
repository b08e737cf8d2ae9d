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

/*! \file jmid/models/creditriskmodel.hpp
    \brief Issuer default probabilities implied by credit spreads
    \ingroup models
*/

#pragma once

#include <jmid/configuration/creditriskconfig.hpp>
#include <jmid/marketdata/governmentcurve.hpp>
#include <jmid/marketdata/marketdatum.hpp>

#include <map>
#include <set>
#include <vector>

namespace jmi {
namespace data {

//! Credit profile of one issuer
/*!
  A single flat hazard rate per issuer is implied from the average spread of its bonds over the government curve,
  the term structure of the hazard rate is not modelled.

  \ingroup models
*/
struct IssuerCreditProfile {
    IssuerCreditProfile()
        : numberOfBonds(0), avgMaturityYears(0.0), spread(0.0), hazardRate(0.0), pd5y(0.0), negativeSpread(false) {}

    string issuerId;
    Size numberOfBonds;
    Real avgMaturityYears;
    //! Average spread over the government curve in decimal form
    Real spread;
    //! Flat hazard rate, zero if the spread is negative
    Real hazardRate;
    //! Five year default probability, the ranking field
    Real pd5y;
    //! Default probability by horizon in years
    std::map<Real, Real> pdCurve;
    //! True if the average spread was negative and the hazard rate was clamped to zero
    bool negativeSpread;

    //! Default probability at any horizon
    Real defaultProbability(Real horizon) const;
};

bool operator==(const IssuerCreditProfile& lhs, const IssuerCreditProfile& rhs);

//! Spread of a corporate yield over the government yield
Real creditSpread(Real corporateYield, Real governmentYield);

//! Flat hazard rate \f$ \lambda = \max(s, 0) / (1 - R) \f$
/*! Throws a DataValidationError if the recovery rate is not in [0, 1).
    \ingroup models
*/
Real impliedHazardRate(Real spread, Real recoveryRate);

//! \f$ PD(T) = 1 - e^{-\lambda T} \f$, throws an InvalidTenorError for a negative horizon
Real defaultProbability(Real hazardRate, Real horizon);

//! Profile of one issuer from its bond quotes
/*! Quotes of other issuers are ignored. Throws an UnknownIssuerError if there is no quote for the issuer and a
    CurveLookupError if a bond matures outside the government curve, unless the config says to continue on error
    in which case such bonds are skipped.
    \ingroup models
*/
IssuerCreditProfile computeIssuerProfile(const string& issuerId, const std::vector<BondQuote>& quotes,
                                         const GovernmentCurve& curve, const CreditRiskConfig& config);

//! Ranked profiles of all issuers in \p quotes
std::vector<IssuerCreditProfile> computeCreditProfiles(const std::vector<BondQuote>& quotes,
                                                       const GovernmentCurve& curve, const CreditRiskConfig& config);

//! Ranked profiles of the given issuers
/*! Throws an UnknownIssuerError for an issuer without quotes.
    \ingroup models
*/
std::vector<IssuerCreditProfile> computeCreditProfiles(const std::vector<BondQuote>& quotes,
                                                       const GovernmentCurve& curve, const CreditRiskConfig& config,
                                                       const std::set<string>& issuers);

//! Sort by five year default probability descending, ties by issuer id ascending
void rankByDefaultProbability(std::vector<IssuerCreditProfile>& profiles);

} // namespace data
} // namespace jmi

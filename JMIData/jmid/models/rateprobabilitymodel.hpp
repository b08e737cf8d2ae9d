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

/*! \file jmid/models/rateprobabilitymodel.hpp
    \brief Policy rate move probabilities implied by OIS rates
    \ingroup models
*/

#pragma once

#include <jmid/configuration/rateprobabilityconfig.hpp>
#include <jmid/marketdata/marketdatum.hpp>

#include <vector>

namespace jmi {
namespace data {

//! Probability of one policy scenario
struct StepProbability {
    StepProbability() : step(0.0), raw(0.0), value(0.0), boundaryHit(false) {}
    StepProbability(Real s, Real r, Real v, bool b) : step(s), raw(r), value(v), boundaryHit(b) {}
    //! Signed step size, zero for the no change scenario
    Real step;
    //! Probability before clipping
    Real raw;
    //! Probability clipped to [0, 1]
    Real value;
    //! True if the raw probability was outside [0, 1]
    bool boundaryHit;
};

bool operator==(const StepProbability& lhs, const StepProbability& rhs);

//! Market implied probabilities of the scenarios at the next policy meeting
struct RateProbabilityResult {
    RateProbabilityResult()
        : daysToMeeting(0), daysPost(0), currentRate(0.0), postRate(0.0), impliedRate(0.0),
          pNoChangeIndependent(0.0), noChangeDiscrepancy(false) {}

    Date meetingDate;
    //! \f$ D_{pre} \f$
    Integer daysToMeeting;
    //! \f$ D_{post} \f$
    Integer daysPost;
    //! \f$ r_{pre} \f$
    Real currentRate;
    //! \f$ r_{post} \f$
    Real postRate;
    //! \f$ E[r] \f$
    Real impliedRate;

    StepProbability hike;
    StepProbability cut;
    StepProbability noChange;

    //! No change probability of the single step model with the expected step of the meeting
    Real pNoChangeIndependent;
    //! True if pNoChangeIndependent and noChange.value disagree
    bool noChangeDiscrepancy;

    Real pHike() const { return hike.value; }
    Real pCut() const { return cut.value; }
    Real pNoChange() const { return noChange.value; }
    //! True if a move probability was clipped at one or the no change probability was clipped
    /*! The move opposite to the implied rate change always has a negative raw probability, clipping it to zero
        is expected and does not count.
     */
    bool boundaryHit() const { return hike.raw > 1.0 || cut.raw > 1.0 || noChange.boundaryHit; }
};

bool operator==(const RateProbabilityResult& lhs, const RateProbabilityResult& rhs);

//! Expected short rate after the meeting
/*! Solves the blended rate identity
    \f[ r_{post} = \frac{r_{pre} D_{pre} + E[r] D_{post}}{D_{pre} + D_{post}} \f]
    for \f$ E[r] \f$. Throws an InvalidTenorError if \p daysPost is not positive.
    \ingroup models
*/
Real impliedPostMeetingRate(Real rPre, Real rPost, Integer daysPre, Integer daysPost);

//! Probability of a policy move of size \p step
/*! \f$ p = (E[r] - r_{pre}) / \Delta \f$, clipped to [0, 1] with the boundary indicator set if clipping took
    place. Throws an InvalidStepSizeError if \p step is zero.
    \ingroup models
*/
StepProbability impliedStepProbability(Real rPre, Real rPost, Integer daysPre, Integer daysPost, Real step);

//! Clip a probability to [0, 1]
StepProbability clipProbability(Real step, Real raw);

//! Hike, cut and no change probabilities at the next meeting
/*! \f$ r_{pre} \f$ is the quote at \p overnightTenorDays if there is one, otherwise the shortest quote.
    \f$ r_{post} \f$ is the first quote with a tenor beyond the meeting, an InvalidTenorError is thrown if there is
    none. The hike step must be positive and the cut step negative (InvalidStepSizeError).

    \f$ p_{no change} = 1 - p_{hike} - p_{cut} \f$ with the clipped probabilities. The no change probability is
    also computed independently in single step mode, \f$ 1 - (E[r] - r_{pre}) / \Delta_{exp} \f$ clipped to
    [0, 1], with the expected step of the meeting (the hike step if that is zero). A disagreement is flagged and
    logged as a structured model warning. It shows up when the market prices a move against the expected step or
    when the hike and cut steps differ in size from the expected one.
    \ingroup models
*/
RateProbabilityResult computeRateProbabilities(const std::vector<OISQuote>& quotes, const PolicyMeeting& meeting,
                                               const PolicyStepSizes& stepSizes, Integer overnightTenorDays = 1);

//! Single step mode using the expected step of the meeting
/*! Only the scenario in the direction of the meeting's expected step is modelled, the opposite one is reported
    as zero and \f$ p_{step} + p_{no change} = 1 \f$.
    \ingroup models
*/
RateProbabilityResult computeStepProbability(const std::vector<OISQuote>& quotes, const PolicyMeeting& meeting,
                                             Integer overnightTenorDays = 1);

} // namespace data
} // namespace jmi

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

#include <jmid/models/rateprobabilitymodel.hpp>
#include <jmid/models/structuredmodelwarning.hpp>
#include <jmid/utilities/errors.hpp>
#include <jmid/utilities/log.hpp>
#include <jmid/utilities/to_string.hpp>

#include <ql/math/comparison.hpp>

#include <algorithm>

using namespace QuantLib;
using std::vector;

namespace jmi {
namespace data {

namespace {

struct MeetingBracket {
    Real rPre;
    Real rPost;
    Integer daysPost;
};

MeetingBracket bracketMeeting(const vector<OISQuote>& quotes, const PolicyMeeting& meeting,
                              Integer overnightTenorDays) {
    JMI_REQUIRE(!quotes.empty(), DataValidationError, "no OIS quotes given");
    JMI_REQUIRE(meeting.daysUntil() >= 0, InvalidTenorError,
                "days until the meeting (" << meeting.daysUntil() << ") must be non-negative");
    for (Size i = 1; i < quotes.size(); ++i) {
        JMI_REQUIRE(quotes[i].tenorDays() > quotes[i - 1].tenorDays(), DataValidationError,
                    "OIS tenors must be strictly increasing, got " << quotes[i - 1].tenorDays() << " followed by "
                                                                   << quotes[i].tenorDays());
    }

    auto overnight = std::find_if(quotes.begin(), quotes.end(),
                                  [overnightTenorDays](const OISQuote& q) { return q.tenorDays() == overnightTenorDays; });
    Real rPre = overnight == quotes.end() ? quotes.front().rate() : overnight->rate();

    Integer dPre = meeting.daysUntil();
    auto post = std::find_if(quotes.begin(), quotes.end(), [dPre](const OISQuote& q) { return q.tenorDays() > dPre; });
    JMI_REQUIRE(post != quotes.end(), InvalidTenorError,
                "no OIS tenor beyond the meeting in " << dPre << " days, longest tenor is "
                                                      << quotes.back().tenorDays() << " days");
    return {rPre, post->rate(), post->tenorDays() - dPre};
}

void warnIfClamped(const StepProbability& p, const string& scenario, const PolicyMeeting& meeting) {
    if (!p.boundaryHit)
        return;
    std::ostringstream oss;
    oss << "raw " << scenario << " probability " << p.raw << " clipped to " << p.value;
    if (p.raw > 1.0 || scenario == "no change")
        StructuredModelWarningMessage("Probability clipped", oss.str(), "meeting " + to_string(meeting.date())).log();
    else
        DLOG(oss.str());
}

} // namespace

bool operator==(const StepProbability& lhs, const StepProbability& rhs) {
    return lhs.step == rhs.step && lhs.raw == rhs.raw && lhs.value == rhs.value && lhs.boundaryHit == rhs.boundaryHit;
}

bool operator==(const RateProbabilityResult& lhs, const RateProbabilityResult& rhs) {
    return lhs.meetingDate == rhs.meetingDate && lhs.daysToMeeting == rhs.daysToMeeting &&
           lhs.daysPost == rhs.daysPost && lhs.currentRate == rhs.currentRate && lhs.postRate == rhs.postRate &&
           lhs.impliedRate == rhs.impliedRate && lhs.hike == rhs.hike && lhs.cut == rhs.cut &&
           lhs.noChange == rhs.noChange && lhs.pNoChangeIndependent == rhs.pNoChangeIndependent &&
           lhs.noChangeDiscrepancy == rhs.noChangeDiscrepancy;
}

Real impliedPostMeetingRate(Real rPre, Real rPost, Integer daysPre, Integer daysPost) {
    JMI_REQUIRE(daysPost > 0, InvalidTenorError,
                "days from the meeting to the post meeting tenor (" << daysPost << ") must be positive");
    JMI_REQUIRE(daysPre >= 0, InvalidTenorError, "days until the meeting (" << daysPre << ") must be non-negative");
    return (rPost * (daysPre + daysPost) - rPre * daysPre) / daysPost;
}

StepProbability clipProbability(Real step, Real raw) {
    Real value = std::min(std::max(raw, 0.0), 1.0);
    return StepProbability(step, raw, value, raw < 0.0 || raw > 1.0);
}

StepProbability impliedStepProbability(Real rPre, Real rPost, Integer daysPre, Integer daysPost, Real step) {
    JMI_REQUIRE(step != 0.0, InvalidStepSizeError, "policy step size must not be zero");
    Real expected = impliedPostMeetingRate(rPre, rPost, daysPre, daysPost);
    return clipProbability(step, (expected - rPre) / step);
}

RateProbabilityResult computeRateProbabilities(const vector<OISQuote>& quotes, const PolicyMeeting& meeting,
                                               const PolicyStepSizes& stepSizes, Integer overnightTenorDays) {
    JMI_REQUIRE(stepSizes.hike > 0.0, InvalidStepSizeError, "hike step (" << stepSizes.hike << ") must be positive");
    JMI_REQUIRE(stepSizes.cut < 0.0, InvalidStepSizeError, "cut step (" << stepSizes.cut << ") must be negative");

    MeetingBracket b = bracketMeeting(quotes, meeting, overnightTenorDays);

    RateProbabilityResult res;
    res.meetingDate = meeting.date();
    res.daysToMeeting = meeting.daysUntil();
    res.daysPost = b.daysPost;
    res.currentRate = b.rPre;
    res.postRate = b.rPost;
    res.impliedRate = impliedPostMeetingRate(b.rPre, b.rPost, meeting.daysUntil(), b.daysPost);

    res.hike = impliedStepProbability(b.rPre, b.rPost, meeting.daysUntil(), b.daysPost, stepSizes.hike);
    res.cut = impliedStepProbability(b.rPre, b.rPost, meeting.daysUntil(), b.daysPost, stepSizes.cut);
    res.noChange = clipProbability(0.0, 1.0 - res.hike.value - res.cut.value);

    // independent estimate from the single step model with the step the meeting is expected to deliver
    Real expectedStep = meeting.expectedStep() != 0.0 ? meeting.expectedStep() : stepSizes.hike;
    StepProbability single = impliedStepProbability(b.rPre, b.rPost, meeting.daysUntil(), b.daysPost, expectedStep);
    res.pNoChangeIndependent = clipProbability(0.0, 1.0 - single.raw).value;
    res.noChangeDiscrepancy = !close_enough(res.pNoChangeIndependent, res.noChange.value);

    warnIfClamped(res.hike, "hike", meeting);
    warnIfClamped(res.cut, "cut", meeting);
    warnIfClamped(res.noChange, "no change", meeting);
    if (res.noChangeDiscrepancy) {
        std::ostringstream oss;
        oss << "no change probability " << res.noChange.value << " differs from independent estimate "
            << res.pNoChangeIndependent;
        StructuredModelWarningMessage("No change discrepancy", oss.str(), "meeting " + to_string(meeting.date()))
            .log();
    }

    DLOG("RateProbabilityModel: E[r] " << res.impliedRate << " r_pre " << res.currentRate << " hike "
                                       << res.pHike() << " cut " << res.pCut() << " no change " << res.pNoChange());
    return res;
}

RateProbabilityResult computeStepProbability(const vector<OISQuote>& quotes, const PolicyMeeting& meeting,
                                             Integer overnightTenorDays) {
    JMI_REQUIRE(meeting.expectedStep() != 0.0, InvalidStepSizeError, "expected policy step must not be zero");
    MeetingBracket b = bracketMeeting(quotes, meeting, overnightTenorDays);

    RateProbabilityResult res;
    res.meetingDate = meeting.date();
    res.daysToMeeting = meeting.daysUntil();
    res.daysPost = b.daysPost;
    res.currentRate = b.rPre;
    res.postRate = b.rPost;
    res.impliedRate = impliedPostMeetingRate(b.rPre, b.rPost, meeting.daysUntil(), b.daysPost);

    StepProbability p =
        impliedStepProbability(b.rPre, b.rPost, meeting.daysUntil(), b.daysPost, meeting.expectedStep());
    if (meeting.expectedStep() > 0.0)
        res.hike = p;
    else
        res.cut = p;
    // a raw step probability outside [0, 1] carries over to no change and is flagged there
    res.noChange = clipProbability(0.0, 1.0 - p.raw);
    res.pNoChangeIndependent = res.noChange.value;
    res.noChangeDiscrepancy = false;

    warnIfClamped(p, meeting.expectedStep() > 0.0 ? "hike" : "cut", meeting);
    return res;
}

} // namespace data
} // namespace jmi

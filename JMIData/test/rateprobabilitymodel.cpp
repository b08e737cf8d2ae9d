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

#include <boost/test/unit_test.hpp>
#include <jmid/models/rateprobabilitymodel.hpp>
#include <jmid/utilities/errors.hpp>
#include <jmid/utilities/log.hpp>
#include <jmit/toplevelfixture.hpp>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace jmi::data;
using std::vector;

namespace {

const Date meetingDate(19, March, 2026);

// overnight quote and one quote beyond a meeting in D_pre days
vector<OISQuote> bracketQuotes(Real rPre, Real rPost, Integer dPre, Integer dPost) {
    return {OISQuote(1, rPre), OISQuote(dPre + dPost, rPost)};
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(JMIDataTestSuite, jmi::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(RateProbabilityModelTests)

BOOST_AUTO_TEST_CASE(testHikeScenario) {
    BOOST_TEST_MESSAGE("Testing the 30% hike scenario...");

    // r_pre = 0.10%, D_pre = 30, D_post = 60, r_post = 0.15%, 25bp step
    BOOST_CHECK_CLOSE(impliedPostMeetingRate(0.001, 0.0015, 30, 60), 0.00175, 1.0e-10);

    StepProbability p = impliedStepProbability(0.001, 0.0015, 30, 60, 0.0025);
    BOOST_CHECK_CLOSE(p.value, 0.30, 1.0e-8);
    BOOST_CHECK(!p.boundaryHit);

    PolicyMeeting meeting(meetingDate, 30, 0.0025);
    RateProbabilityResult res = computeRateProbabilities(bracketQuotes(0.001, 0.0015, 30, 60), meeting,
                                                         PolicyStepSizes(0.0025, -0.0025));
    BOOST_CHECK_EQUAL(res.meetingDate, meetingDate);
    BOOST_CHECK_EQUAL(res.daysToMeeting, 30);
    BOOST_CHECK_EQUAL(res.daysPost, 60);
    BOOST_CHECK_EQUAL(res.currentRate, 0.001);
    BOOST_CHECK_EQUAL(res.postRate, 0.0015);
    BOOST_CHECK_CLOSE(res.impliedRate, 0.00175, 1.0e-10);
    BOOST_CHECK_CLOSE(res.pHike(), 0.30, 1.0e-8);
    BOOST_CHECK_EQUAL(res.pCut(), 0.0);
    BOOST_CHECK_CLOSE(res.pNoChange(), 0.70, 1.0e-8);
    BOOST_CHECK_CLOSE(res.pHike() + res.pCut() + res.pNoChange(), 1.0, 1.0e-10);

    // the cut raw probability is negative, clipping it is expected
    BOOST_CHECK(res.cut.boundaryHit);
    BOOST_CHECK_CLOSE(res.cut.raw, -0.30, 1.0e-8);
    BOOST_CHECK(!res.boundaryHit());

    BOOST_CHECK_CLOSE(res.pNoChangeIndependent, 0.70, 1.0e-8);
    BOOST_CHECK(!res.noChangeDiscrepancy);
}

BOOST_AUTO_TEST_CASE(testCutScenario) {
    BOOST_TEST_MESSAGE("Testing a priced cut...");

    // E[r] = (0.0005 * 90 - 0.001 * 30) / 60 = 0.00025, i.e. 7.5bp below r_pre
    PolicyMeeting meeting(meetingDate, 30, -0.0025);
    RateProbabilityResult res = computeRateProbabilities(bracketQuotes(0.001, 0.0005, 30, 60), meeting,
                                                         PolicyStepSizes(0.0025, -0.0025));
    BOOST_CHECK_CLOSE(res.impliedRate, 0.00025, 1.0e-8);
    BOOST_CHECK_EQUAL(res.pHike(), 0.0);
    BOOST_CHECK(res.hike.boundaryHit);
    BOOST_CHECK(!res.cut.boundaryHit);
    BOOST_CHECK(!res.boundaryHit());
    BOOST_CHECK_CLOSE(res.cut.raw, 0.30, 1.0e-8);
    BOOST_CHECK_CLOSE(res.pCut(), 0.30, 1.0e-8);
    BOOST_CHECK_CLOSE(res.pNoChange(), 0.70, 1.0e-8);
    BOOST_CHECK(!res.noChangeDiscrepancy);
}

BOOST_AUTO_TEST_CASE(testClosedForm) {
    BOOST_TEST_MESSAGE("Testing that the implied rate reproduces the blended OIS rate...");

    Real rPres[] = {-0.001, 0.0, 0.001, 0.005};
    Real rPosts[] = {-0.0005, 0.0012, 0.0015, 0.0075};
    Integer dPres[] = {0, 7, 30, 45};
    Integer dPosts[] = {1, 24, 60, 320};

    for (auto rPre : rPres) {
        for (auto rPost : rPosts) {
            for (auto dPre : dPres) {
                for (auto dPost : dPosts) {
                    Real expected = impliedPostMeetingRate(rPre, rPost, dPre, dPost);
                    Real blended = (rPre * dPre + expected * dPost) / (dPre + dPost);
                    BOOST_CHECK_SMALL(blended - rPost, 1.0e-15);
                }
            }
        }
    }

    // with the meeting today the post meeting tenor rate is the expected rate
    BOOST_CHECK_CLOSE(impliedPostMeetingRate(0.001, 0.0015, 0, 30), 0.0015, 1.0e-10);
}

BOOST_AUTO_TEST_CASE(testMonotonicity) {
    BOOST_TEST_MESSAGE("Testing monotonicity of the hike probability in the post meeting rate...");

    Real previousRaw = -QL_MAX_REAL, previousValue = 0.0;
    for (Real rPost = 0.0005; rPost < 0.0030; rPost += 0.0001) {
        StepProbability p = impliedStepProbability(0.001, rPost, 30, 60, 0.0025);
        BOOST_CHECK(p.raw > previousRaw);
        BOOST_CHECK(p.value >= previousValue);
        BOOST_CHECK(p.value >= 0.0 && p.value <= 1.0);
        previousRaw = p.raw;
        previousValue = p.value;
    }

    // for a cut step the probability decreases in the post meeting rate
    previousRaw = QL_MAX_REAL;
    for (Real rPost = 0.0005; rPost < 0.0030; rPost += 0.0001) {
        StepProbability p = impliedStepProbability(0.001, rPost, 30, 60, -0.0025);
        BOOST_CHECK(p.raw < previousRaw);
        previousRaw = p.raw;
    }
}

BOOST_AUTO_TEST_CASE(testClipping) {
    BOOST_TEST_MESSAGE("Testing clipping of probabilities...");

    StepProbability p = clipProbability(0.0025, 1.4);
    BOOST_CHECK_EQUAL(p.value, 1.0);
    BOOST_CHECK_EQUAL(p.raw, 1.4);
    BOOST_CHECK(p.boundaryHit);

    p = clipProbability(0.0025, -0.2);
    BOOST_CHECK_EQUAL(p.value, 0.0);
    BOOST_CHECK(p.boundaryHit);

    p = clipProbability(0.0025, 0.0);
    BOOST_CHECK_EQUAL(p.value, 0.0);
    BOOST_CHECK(!p.boundaryHit);

    p = clipProbability(0.0025, 1.0);
    BOOST_CHECK_EQUAL(p.value, 1.0);
    BOOST_CHECK(!p.boundaryHit);

    // E[r] 50bp above r_pre prices two hikes
    PolicyMeeting meeting(meetingDate, 30, 0.0025);
    RateProbabilityResult res = computeRateProbabilities(bracketQuotes(0.001, 0.004333333333333333, 30, 60),
                                                         meeting, PolicyStepSizes());
    BOOST_CHECK_EQUAL(res.pHike(), 1.0);
    BOOST_CHECK(res.hike.raw > 1.0);
    BOOST_CHECK(res.hike.boundaryHit);
    BOOST_CHECK(res.boundaryHit());
    BOOST_CHECK_EQUAL(res.pNoChange(), 0.0);
    BOOST_CHECK_EQUAL(res.pNoChangeIndependent, 0.0);
}

BOOST_AUTO_TEST_CASE(testStepProbability) {
    BOOST_TEST_MESSAGE("Testing the single step mode...");

    PolicyMeeting hikeMeeting(meetingDate, 30, 0.0025);
    RateProbabilityResult res = computeStepProbability(bracketQuotes(0.001, 0.0015, 30, 60), hikeMeeting);
    BOOST_CHECK_CLOSE(res.pHike(), 0.30, 1.0e-8);
    BOOST_CHECK_EQUAL(res.pCut(), 0.0);
    BOOST_CHECK_CLOSE(res.pHike() + res.pNoChange(), 1.0, 1.0e-12);
    BOOST_CHECK(!res.boundaryHit());

    PolicyMeeting cutMeeting(meetingDate, 30, -0.0025);
    res = computeStepProbability(bracketQuotes(0.001, 0.0005, 30, 60), cutMeeting);
    BOOST_CHECK_EQUAL(res.pHike(), 0.0);
    BOOST_CHECK_CLOSE(res.pCut(), 0.30, 1.0e-8);
    BOOST_CHECK_CLOSE(res.pCut() + res.pNoChange(), 1.0, 1.0e-12);
    BOOST_CHECK(!res.boundaryHit());

    // a move against the expected step is clipped and flagged
    res = computeStepProbability(bracketQuotes(0.001, 0.0015, 30, 60), cutMeeting);
    BOOST_CHECK_EQUAL(res.pCut(), 0.0);
    BOOST_CHECK_EQUAL(res.pNoChange(), 1.0);
    BOOST_CHECK(res.boundaryHit());

    BOOST_CHECK_THROW(computeStepProbability(bracketQuotes(0.001, 0.0015, 30, 60), PolicyMeeting(meetingDate, 30, 0.0)),
                      InvalidStepSizeError);
}

BOOST_AUTO_TEST_CASE(testQuoteSelection) {
    BOOST_TEST_MESSAGE("Testing selection of the pre and post meeting quotes...");

    PolicyMeeting meeting(meetingDate, 30, 0.0025);
    vector<OISQuote> quotes = {OISQuote(1, 0.001), OISQuote(7, 0.0011), OISQuote(30, 0.0012), OISQuote(90, 0.0015),
                               OISQuote(180, 0.0020)};
    RateProbabilityResult res = computeRateProbabilities(quotes, meeting, PolicyStepSizes());
    // the 30 day tenor ends on the meeting date, the first tenor beyond it is 90 days
    BOOST_CHECK_EQUAL(res.postRate, 0.0015);
    BOOST_CHECK_EQUAL(res.daysPost, 60);
    BOOST_CHECK_EQUAL(res.currentRate, 0.001);

    // without an overnight quote the shortest tenor is used
    vector<OISQuote> noOvernight(quotes.begin() + 1, quotes.end());
    res = computeRateProbabilities(noOvernight, meeting, PolicyStepSizes());
    BOOST_CHECK_EQUAL(res.currentRate, 0.0011);

    // a configured overnight tenor
    res = computeRateProbabilities(quotes, meeting, PolicyStepSizes(), 7);
    BOOST_CHECK_EQUAL(res.currentRate, 0.0011);
}

BOOST_AUTO_TEST_CASE(testErrors) {
    BOOST_TEST_MESSAGE("Testing degenerate model inputs...");

    BOOST_CHECK_THROW(impliedPostMeetingRate(0.001, 0.0015, 30, 0), InvalidTenorError);
    BOOST_CHECK_THROW(impliedPostMeetingRate(0.001, 0.0015, 30, -5), InvalidTenorError);
    BOOST_CHECK_THROW(impliedStepProbability(0.001, 0.0015, 30, 60, 0.0), InvalidStepSizeError);

    PolicyMeeting meeting(meetingDate, 30, 0.0025);
    vector<OISQuote> quotes = bracketQuotes(0.001, 0.0015, 30, 60);
    BOOST_CHECK_THROW(computeRateProbabilities(quotes, meeting, PolicyStepSizes(0.0, -0.0025)), InvalidStepSizeError);
    BOOST_CHECK_THROW(computeRateProbabilities(quotes, meeting, PolicyStepSizes(0.0025, 0.0025)),
                      InvalidStepSizeError);
    BOOST_CHECK_THROW(computeRateProbabilities(quotes, meeting, PolicyStepSizes(-0.0025, -0.0025)),
                      InvalidStepSizeError);

    // no tenor beyond the meeting
    vector<OISQuote> shortQuotes = {OISQuote(1, 0.001), OISQuote(30, 0.0012)};
    BOOST_CHECK_THROW(computeRateProbabilities(shortQuotes, meeting, PolicyStepSizes()), InvalidTenorError);

    BOOST_CHECK_THROW(computeRateProbabilities(vector<OISQuote>(), meeting, PolicyStepSizes()), DataValidationError);
    vector<OISQuote> unsorted = {OISQuote(90, 0.0015), OISQuote(1, 0.001)};
    BOOST_CHECK_THROW(computeRateProbabilities(unsorted, meeting, PolicyStepSizes()), DataValidationError);
}

BOOST_AUTO_TEST_CASE(testClippingIsLogged) {
    BOOST_TEST_MESSAGE("Testing the structured warning for a clipped probability...");

    auto logger = QuantLib::ext::make_shared<BufferLogger>(JMI_WARNING);
    Log::instance().registerLogger(logger);
    Log::instance().setMask(255);
    Log::instance().switchOn();

    PolicyMeeting meeting(meetingDate, 30, 0.0025);
    computeRateProbabilities(bracketQuotes(0.001, 0.004333333333333333, 30, 60), meeting, PolicyStepSizes());

    bool found = false;
    while (logger->hasNext()) {
        std::string msg = logger->next();
        if (msg.find("StructuredMessage") != std::string::npos && msg.find("Probability clipped") != std::string::npos)
            found = true;
    }
    BOOST_CHECK(found);
}

BOOST_AUTO_TEST_CASE(testNoChangeDiscrepancy) {
    BOOST_TEST_MESSAGE("Testing the no change cross check against the single step model...");

    auto logger = QuantLib::ext::make_shared<BufferLogger>(JMI_WARNING);
    Log::instance().registerLogger(logger);
    Log::instance().setMask(255);
    Log::instance().switchOn();

    // E[r] 7.5bp above r_pre with a 25bp hike step and a 50bp cut step, the meeting is expected to cut by 50bp
    PolicyMeeting cutMeeting(meetingDate, 30, -0.005);
    RateProbabilityResult res = computeRateProbabilities(bracketQuotes(0.001, 0.0015, 30, 60), cutMeeting,
                                                         PolicyStepSizes(0.0025, -0.005));
    BOOST_CHECK_CLOSE(res.pHike(), 0.30, 1.0e-8);
    BOOST_CHECK_CLOSE(res.cut.raw, -0.15, 1.0e-8);
    BOOST_CHECK_CLOSE(res.pNoChange(), 0.70, 1.0e-8);
    BOOST_CHECK_EQUAL(res.pNoChangeIndependent, 1.0);
    BOOST_CHECK(res.noChangeDiscrepancy);

    // the expected step is twice the hike step
    PolicyMeeting bigHikeMeeting(meetingDate, 30, 0.005);
    res = computeRateProbabilities(bracketQuotes(0.001, 0.0015, 30, 60), bigHikeMeeting,
                                   PolicyStepSizes(0.0025, -0.0025));
    BOOST_CHECK_CLOSE(res.pNoChange(), 0.70, 1.0e-8);
    BOOST_CHECK_CLOSE(res.pNoChangeIndependent, 0.85, 1.0e-8);
    BOOST_CHECK(res.noChangeDiscrepancy);

    // a cut priced against an expected hike
    PolicyMeeting hikeMeeting(meetingDate, 30, 0.0025);
    res = computeRateProbabilities(bracketQuotes(0.001, 0.0005, 30, 60), hikeMeeting,
                                   PolicyStepSizes(0.0025, -0.0025));
    BOOST_CHECK_CLOSE(res.pCut(), 0.30, 1.0e-8);
    BOOST_CHECK_CLOSE(res.pNoChange(), 0.70, 1.0e-8);
    BOOST_CHECK_EQUAL(res.pNoChangeIndependent, 1.0);
    BOOST_CHECK(res.noChangeDiscrepancy);

    Size warnings = 0;
    while (logger->hasNext()) {
        std::string msg = logger->next();
        if (msg.find("StructuredMessage") != std::string::npos &&
            msg.find("No change discrepancy") != std::string::npos)
            ++warnings;
    }
    BOOST_CHECK_EQUAL(warnings, Size(3));

    // no expected step falls back to the hike step, which agrees with the two sided model
    res = computeRateProbabilities(bracketQuotes(0.001, 0.0015, 30, 60), PolicyMeeting(meetingDate, 30, 0.0),
                                   PolicyStepSizes(0.0025, -0.0025));
    BOOST_CHECK_CLOSE(res.pNoChangeIndependent, 0.70, 1.0e-8);
    BOOST_CHECK(!res.noChangeDiscrepancy);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

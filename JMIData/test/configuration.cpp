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
#include <jmid/configuration/engineconfig.hpp>
#include <jmid/utilities/errors.hpp>
#include <jmit/datapaths.hpp>
#include <jmit/toplevelfixture.hpp>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace jmi::data;
using std::vector;

BOOST_FIXTURE_TEST_SUITE(JMIDataTestSuite, jmi::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(ConfigurationTests)

BOOST_AUTO_TEST_CASE(testEngineConfigFromFile) {
    BOOST_TEST_MESSAGE("Testing loading of the engine configuration...");

    EngineConfig config;
    config.fromFile(TEST_INPUT_FILE("jmiconfig.xml"));

    const MarketDataConfig& md = config.marketDataConfig();
    BOOST_CHECK(md.quotesInPercent());
    BOOST_CHECK_EQUAL(md.quoteFactor(), 0.01);
    BOOST_CHECK_EQUAL(md.corporateCategories().size(), 2U);
    BOOST_CHECK(md.corporateCategories().count(41));
    BOOST_REQUIRE_EQUAL(md.governmentMarkers().size(), 2U);
    BOOST_CHECK_EQUAL(md.governmentMarkers()[1], "国債");
    BOOST_CHECK_EQUAL(md.bondFileEncoding(), "UTF-8");

    const RateProbabilityConfig& rp = config.rateProbabilityConfig();
    BOOST_CHECK_EQUAL(rp.stepSizes().hike, 0.0025);
    BOOST_CHECK_EQUAL(rp.stepSizes().cut, -0.001);
    BOOST_CHECK_EQUAL(rp.overnightTenorDays(), 1);

    const CreditRiskConfig& cr = config.creditRiskConfig();
    BOOST_CHECK_EQUAL(cr.recoveryRate(), 0.4);
    BOOST_CHECK(cr.continueOnError());
    vector<Real> horizons = {1.0, 2.0, 3.0, 5.0, 7.0, 10.0};
    BOOST_CHECK_EQUAL_COLLECTIONS(cr.horizons().begin(), cr.horizons().end(), horizons.begin(), horizons.end());

    // sorted and unique
    const MeetingCalendar& mc = config.meetingCalendar();
    vector<Date> meetings = {Date(23, January, 2026), Date(19, March, 2026), Date(28, April, 2026)};
    BOOST_CHECK_EQUAL_COLLECTIONS(mc.dates().begin(), mc.dates().end(), meetings.begin(), meetings.end());
}

BOOST_AUTO_TEST_CASE(testEngineConfigDefaults) {
    BOOST_TEST_MESSAGE("Testing engine configuration defaults...");

    EngineConfig config;
    config.fromFile(TEST_INPUT_FILE("jmiconfig_minimal.xml"));

    BOOST_CHECK(config.marketDataConfig().quotesInPercent());
    BOOST_CHECK_EQUAL(config.marketDataConfig().corporateCategories().size(), 1U);
    BOOST_CHECK(config.marketDataConfig().corporateCategories().count(40));
    BOOST_CHECK_EQUAL(config.marketDataConfig().bondFileEncoding(), "CP932");
    BOOST_CHECK_EQUAL(config.rateProbabilityConfig().stepSizes().hike, 0.0025);
    BOOST_CHECK_EQUAL(config.rateProbabilityConfig().stepSizes().cut, -0.0025);
    BOOST_CHECK_EQUAL(config.creditRiskConfig().recoveryRate(), 0.10);
    BOOST_CHECK_EQUAL(config.creditRiskConfig().horizons().size(), 4U);
    BOOST_CHECK(config.meetingCalendar().dates().empty());
}

BOOST_AUTO_TEST_CASE(testInvalidStepSize) {
    BOOST_TEST_MESSAGE("Testing rejection of a negative hike step...");

    EngineConfig config;
    BOOST_CHECK_THROW(config.fromFile(TEST_INPUT_FILE("jmiconfig_invalid_step.xml")), InvalidStepSizeError);
    BOOST_CHECK_THROW(RateProbabilityConfig(PolicyStepSizes(0.0025, 0.0)), InvalidStepSizeError);
}

BOOST_AUTO_TEST_CASE(testXmlRoundTrip) {
    BOOST_TEST_MESSAGE("Testing writing and reading back the engine configuration...");

    EngineConfig config;
    config.fromFile(TEST_INPUT_FILE("jmiconfig.xml"));

    EngineConfig config2;
    config2.fromXMLString(config.toXMLString());
    BOOST_CHECK_EQUAL(config2.creditRiskConfig().recoveryRate(), 0.4);
    BOOST_CHECK_EQUAL(config2.creditRiskConfig().horizons().size(), 6U);
    BOOST_CHECK_EQUAL(config2.rateProbabilityConfig().stepSizes().cut, -0.001);
    BOOST_CHECK_EQUAL(config2.marketDataConfig().governmentMarkers().size(), 2U);
    BOOST_CHECK_EQUAL(config2.marketDataConfig().bondFileEncoding(), "UTF-8");
    BOOST_CHECK_EQUAL(config2.meetingCalendar().dates().size(), 3U);
}

BOOST_AUTO_TEST_CASE(testMeetingCalendar) {
    BOOST_TEST_MESSAGE("Testing the meeting calendar...");

    MeetingCalendar calendar({Date(19, March, 2026), Date(23, January, 2026)});
    BOOST_CHECK_EQUAL(calendar.nextMeeting(Date(16, January, 2026)), Date(23, January, 2026));
    BOOST_CHECK_EQUAL(calendar.nextMeeting(Date(23, January, 2026)), Date(23, January, 2026));
    BOOST_CHECK_EQUAL(calendar.nextMeeting(Date(24, January, 2026)), Date(19, March, 2026));
    BOOST_CHECK(calendar.nextMeeting(Date(20, March, 2026)) == Date());

    MeetingCalendar parsed;
    parsed.fromXMLString("<MeetingCalendar><Meeting>20260123</Meeting><Meeting>2026-03-19</Meeting>"
                         "</MeetingCalendar>");
    BOOST_CHECK_EQUAL(parsed.dates().size(), 2U);
    BOOST_CHECK_THROW(parsed.fromXMLString("<MeetingCalendar><Meeting>next week</Meeting></MeetingCalendar>"),
                      QuantLib::Error);
    BOOST_CHECK_THROW(parsed.fromXMLString("<Calendar/>"), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

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
#include <jmid/marketdata/marketdataadapter.hpp>
#include <jmid/utilities/errors.hpp>
#include <jmit/toplevelfixture.hpp>
#include <ql/time/daycounters/actual365fixed.hpp>

#include <limits>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace jmi::data;
using std::string;
using std::vector;

namespace {

const Date sourceDate(16, January, 2026);

RawBondRecord bondRecord(Integer category, const string& code, const string& name, const Date& maturity, Real yield) {
    return RawBondRecord{sourceDate, category, code, name, maturity, 1.0, yield};
}

vector<RawBondRecord> bondRecords() {
    return {bondRecord(2, "0010001", "国庫短期証券１３５０", Date(16, January, 2027), 0.70),
            bondRecord(2, "0020002", "利付国債（５年）１８０", Date(16, January, 2031), 1.20),
            bondRecord(2, "0030003", "利付国債（１０年）３８０", Date(16, January, 2036), 1.80),
            bondRecord(40, "1234567", "ソフトバンクグループ５５", Date(16, January, 2031), 3.10),
            bondRecord(40, "1234568", "ソフトバンクグループ６１", Date(16, January, 2033), 3.50),
            bondRecord(40, "2345678", "トヨタ自動車　１２", Date(16, January, 2029), 1.30),
            bondRecord(50, "4567890", "地方債テスト１", Date(16, January, 2030), 1.10)};
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(JMIDataTestSuite, jmi::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(MarketDataAdapterTests)

BOOST_AUTO_TEST_CASE(testOisQuotes) {
    BOOST_TEST_MESSAGE("Testing OIS quote normalisation...");

    MarketDataAdapter adapter;
    vector<RawOisQuote> raw = {{"3M", 0.55}, {"1D", 0.477}, {"1M", 0.50}};
    vector<OISQuote> quotes = adapter.oisQuotes(raw, sourceDate);

    BOOST_REQUIRE_EQUAL(quotes.size(), 3U);
    BOOST_CHECK_EQUAL(quotes[0].tenorDays(), 1);
    BOOST_CHECK_EQUAL(quotes[1].tenorDays(), 31);
    BOOST_CHECK_EQUAL(quotes[2].tenorDays(), 90);
    BOOST_CHECK_CLOSE(quotes[0].rate(), 0.00477, 1.0e-10);
    BOOST_CHECK_CLOSE(quotes[1].rate(), 0.0050, 1.0e-10);
    BOOST_CHECK_CLOSE(quotes[2].rate(), 0.0055, 1.0e-10);
}

BOOST_AUTO_TEST_CASE(testOisQuotesInDecimal) {
    BOOST_TEST_MESSAGE("Testing OIS quotes given in decimal form...");

    MarketDataAdapter adapter(MarketDataConfig(false, {40}, {"国債"}));
    vector<OISQuote> quotes = adapter.oisQuotes({{"1D", 0.00477}}, sourceDate);
    BOOST_REQUIRE_EQUAL(quotes.size(), 1U);
    BOOST_CHECK_EQUAL(quotes[0].rate(), 0.00477);
}

BOOST_AUTO_TEST_CASE(testOisValidation) {
    BOOST_TEST_MESSAGE("Testing OIS quote validation...");

    MarketDataAdapter adapter;
    // 1M and 31 days are the same tenor as of the source date
    BOOST_CHECK_THROW(adapter.oisQuotes({{"1M", 0.5}, {"31", 0.5}}, sourceDate), DataValidationError);
    BOOST_CHECK_THROW(adapter.oisQuotes({{"-1D", 0.5}}, sourceDate), DataValidationError);
    BOOST_CHECK_THROW(adapter.oisQuotes({{"1D", std::numeric_limits<Real>::quiet_NaN()}}, sourceDate),
                      DataValidationError);
    BOOST_CHECK_THROW(adapter.oisQuotes({{"overnight", 0.5}}, sourceDate), DataValidationError);

    BOOST_CHECK_THROW(MarketDataAdapter::validate(vector<OISQuote>{OISQuote(1, 0.001), OISQuote(1, 0.002)}),
                      DataValidationError);
    BOOST_CHECK_NO_THROW(MarketDataAdapter::validate(vector<OISQuote>{OISQuote(0, 0.001), OISQuote(1, 0.002)}));
}

BOOST_AUTO_TEST_CASE(testNextMeeting) {
    BOOST_TEST_MESSAGE("Testing selection of the next policy meeting...");

    MarketDataAdapter adapter(MarketDataConfig(), 0.0025);
    vector<Date> dates = {Date(19, March, 2026), Date(23, January, 2026), Date(19, December, 2025)};

    PolicyMeeting meeting = adapter.nextMeeting(dates, sourceDate);
    BOOST_CHECK_EQUAL(meeting.date(), Date(23, January, 2026));
    BOOST_CHECK_EQUAL(meeting.daysUntil(), 7);
    BOOST_CHECK_EQUAL(meeting.expectedStep(), 0.0025);

    // a meeting on the source date is still ahead
    meeting = adapter.nextMeeting(dates, Date(23, January, 2026));
    BOOST_CHECK_EQUAL(meeting.date(), Date(23, January, 2026));
    BOOST_CHECK_EQUAL(meeting.daysUntil(), 0);

    BOOST_CHECK_THROW(adapter.nextMeeting(dates, Date(20, March, 2026)), MissingMeetingError);
    BOOST_CHECK_THROW(adapter.nextMeeting(vector<Date>(), sourceDate), MissingMeetingError);
    BOOST_CHECK_THROW(adapter.nextMeeting(dates, Date()), DataValidationError);
}

BOOST_AUTO_TEST_CASE(testBondClassification) {
    BOOST_TEST_MESSAGE("Testing classification of JSDA bond records...");

    MarketDataAdapter adapter;
    vector<RawBondRecord> records = bondRecords();
    BOOST_CHECK(adapter.isGovernmentBond(records[0]));
    BOOST_CHECK(adapter.isGovernmentBond(records[1]));
    BOOST_CHECK(!adapter.isCorporateBond(records[1]));
    BOOST_CHECK(adapter.isCorporateBond(records[3]));
    BOOST_CHECK(!adapter.isGovernmentBond(records[3]));
    BOOST_CHECK(!adapter.isCorporateBond(records[6]));
    BOOST_CHECK(!adapter.isGovernmentBond(records[6]));
}

BOOST_AUTO_TEST_CASE(testBondQuotes) {
    BOOST_TEST_MESSAGE("Testing corporate bond quotes...");

    MarketDataAdapter adapter;
    vector<BondQuote> quotes = adapter.bondQuotes(bondRecords(), sourceDate);
    BOOST_REQUIRE_EQUAL(quotes.size(), 3U);

    BOOST_CHECK_EQUAL(quotes[0].issuerId(), "ソフトバンクグループ");
    BOOST_CHECK_EQUAL(quotes[1].issuerId(), "ソフトバンクグループ");
    BOOST_CHECK_EQUAL(quotes[2].issuerId(), "トヨタ自動車");
    BOOST_CHECK_EQUAL(quotes[0].issueCode(), "1234567");
    BOOST_CHECK_CLOSE(quotes[0].yield(), 0.031, 1.0e-10);
    BOOST_CHECK_CLOSE(quotes[0].maturityYears(),
                      Actual365Fixed().yearFraction(sourceDate, Date(16, January, 2031)), 1.0e-10);
    // 2028 is a leap year
    BOOST_CHECK_CLOSE(quotes[2].maturityYears(), 1096.0 / 365.0, 1.0e-10);
}

BOOST_AUTO_TEST_CASE(testBondQuoteValidation) {
    BOOST_TEST_MESSAGE("Testing corporate bond quote validation...");

    MarketDataAdapter adapter;
    vector<RawBondRecord> matured = {bondRecord(40, "1", "トヨタ自動車１", sourceDate, 1.0)};
    BOOST_CHECK_THROW(adapter.bondQuotes(matured, sourceDate), DataValidationError);

    vector<RawBondRecord> noYield = {
        bondRecord(40, "1", "トヨタ自動車１", Date(16, January, 2029), std::numeric_limits<Real>::infinity())};
    BOOST_CHECK_THROW(adapter.bondQuotes(noYield, sourceDate), DataValidationError);

    vector<RawBondRecord> noName = {bondRecord(40, "1", "１２", Date(16, January, 2029), 1.0)};
    BOOST_CHECK_THROW(adapter.bondQuotes(noName, sourceDate), DataValidationError);

    BOOST_CHECK_THROW(MarketDataAdapter::validate(vector<BondQuote>{BondQuote("A", -1.0, 0.01)}),
                      DataValidationError);
}

BOOST_AUTO_TEST_CASE(testGovernmentCurveFromRecords) {
    BOOST_TEST_MESSAGE("Testing the government curve built from bond records...");

    MarketDataAdapter adapter;
    RawMarketData raw;
    raw.sourceDate = sourceDate;
    raw.bondRecords = bondRecords();
    // a second bond at the five year point, the yields are averaged
    raw.bondRecords.push_back(bondRecord(2, "0020003", "利付国債（５年）１８１", Date(16, January, 2031), 1.40));

    QuantLib::ext::shared_ptr<GovernmentCurve> curve = adapter.governmentCurve(raw);
    BOOST_REQUIRE_EQUAL(curve->points().size(), 3U);
    BOOST_CHECK_CLOSE(curve->points()[0].maturityYears(), 1.0, 1.0e-10);
    BOOST_CHECK_CLOSE(curve->points()[0].yield(), 0.007, 1.0e-10);
    BOOST_CHECK_CLOSE(curve->points()[1].yield(), 0.013, 1.0e-10);
    BOOST_CHECK_CLOSE(curve->points()[2].yield(), 0.018, 1.0e-10);
}

BOOST_AUTO_TEST_CASE(testGovernmentCurveFromPoints) {
    BOOST_TEST_MESSAGE("Testing the government curve built from explicit points...");

    MarketDataAdapter adapter;
    RawMarketData raw;
    raw.sourceDate = sourceDate;
    raw.bondRecords = bondRecords();
    raw.governmentCurve = {{2.0, 0.80}, {7.0, 1.50}};

    QuantLib::ext::shared_ptr<GovernmentCurve> curve = adapter.governmentCurve(raw);
    BOOST_REQUIRE_EQUAL(curve->points().size(), 2U);
    BOOST_CHECK_EQUAL(curve->minMaturity(), 2.0);
    BOOST_CHECK_CLOSE(curve->yield(7.0), 0.015, 1.0e-10);

    raw.governmentCurve = {{2.0, 0.80}};
    BOOST_CHECK_THROW(adapter.governmentCurve(raw), DataValidationError);
    raw.governmentCurve = {{2.0, 0.80}, {-1.0, 0.5}};
    BOOST_CHECK_THROW(adapter.governmentCurve(raw), DataValidationError);
}

BOOST_AUTO_TEST_CASE(testAdapt) {
    BOOST_TEST_MESSAGE("Testing adaptation of a complete raw data set...");

    MarketDataAdapter adapter;
    RawMarketData raw;
    raw.sourceDate = sourceDate;
    raw.oisQuotes = {{"1D", 0.477}, {"1M", 0.55}, {"3M", 0.60}};
    raw.meetingDates = {Date(23, January, 2026)};
    raw.bondRecords = bondRecords();

    MarketInputs inputs = adapter.adapt(raw);
    BOOST_CHECK_EQUAL(inputs.sourceDate, sourceDate);
    BOOST_CHECK_EQUAL(inputs.dataVersion, "2026-01-16");
    BOOST_CHECK_EQUAL(inputs.oisQuotes.size(), 3U);
    BOOST_CHECK_EQUAL(inputs.meeting.daysUntil(), 7);
    BOOST_CHECK_EQUAL(inputs.bondQuotes.size(), 3U);
    BOOST_REQUIRE(inputs.governmentCurve);
    BOOST_CHECK_EQUAL(inputs.governmentCurve->points().size(), 3U);

    raw.dataVersion = "2026-01-16 close";
    BOOST_CHECK_EQUAL(adapter.adapt(raw).dataVersion, "2026-01-16 close");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

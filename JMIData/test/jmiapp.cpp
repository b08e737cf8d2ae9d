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
#include <jmid/app/jmiapp.hpp>
#include <jmit/datapaths.hpp>
#include <jmit/fileutilities.hpp>
#include <jmit/toplevelfixture.hpp>

#include <sstream>

using namespace QuantLib;
using namespace boost::unit_test_framework;
using namespace jmi::data;
using std::string;
using std::vector;

namespace {

QuantLib::ext::shared_ptr<Parameters> parameters(const string& bondFile, const string& dataVersion = "") {
    std::ostringstream xml;
    xml << "<JMI><Setup>"
        << "<Parameter name=\"inputPath\">" << TEST_INPUT << "</Parameter>"
        << "<Parameter name=\"outputPath\">" << TEST_OUTPUT << "</Parameter>"
        << "<Parameter name=\"configFile\">jmiconfig.xml</Parameter>"
        << "<Parameter name=\"oisFile\">ois.csv</Parameter>"
        << "<Parameter name=\"bondFile\">" << bondFile << "</Parameter>";
    if (!dataVersion.empty())
        xml << "<Parameter name=\"dataVersion\">" << dataVersion << "</Parameter>";
    xml << "</Setup><Logging><Parameter name=\"logMask\">255</Parameter></Logging>"
        << "<Output><Parameter name=\"snapshotFile\">metrics.json</Parameter></Output></JMI>";
    auto params = QuantLib::ext::make_shared<Parameters>();
    params->fromXMLString(xml.str());
    return params;
}

bool logContains(const string& text) {
    for (const auto& line : readLines(TEST_OUTPUT_FILE("log.txt"))) {
        if (line.find(text) != string::npos)
            return true;
    }
    return false;
}

} // namespace

BOOST_FIXTURE_TEST_SUITE(JMIDataTestSuite, jmi::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(JMIAppTests)

BOOST_AUTO_TEST_CASE(testParameters) {
    BOOST_TEST_MESSAGE("Testing the application parameters...");

    QuantLib::ext::shared_ptr<Parameters> params = parameters("jsda.csv", "v1");
    BOOST_CHECK(params->hasGroup("setup"));
    BOOST_CHECK(params->hasGroup("logging"));
    BOOST_CHECK(params->hasGroup("output"));
    BOOST_CHECK_EQUAL(params->get("setup", "oisFile"), "ois.csv");
    BOOST_CHECK_EQUAL(params->get("setup", "dataVersion"), "v1");
    BOOST_CHECK_EQUAL(params->get("logging", "logMask"), "255");
    BOOST_CHECK_EQUAL(params->get("setup", "asOfDate", false), "");
    BOOST_CHECK_THROW(params->get("setup", "asOfDate"), QuantLib::Error);
    BOOST_CHECK_THROW(params->data("markets"), QuantLib::Error);
    BOOST_CHECK_EQUAL(params->data("output").size(), 1U);

    // round trip through xml
    Parameters copy;
    copy.fromXMLString(params->toXMLString());
    BOOST_CHECK(copy.data("setup") == params->data("setup"));
    BOOST_CHECK(copy.data("output") == params->data("output"));

    Parameters invalid;
    BOOST_CHECK_THROW(invalid.fromXMLString("<JMI><Logging/></JMI>"), QuantLib::Error);
    BOOST_CHECK_THROW(invalid.fromXMLString("<Parameters><Setup/></Parameters>"), QuantLib::Error);
    BOOST_CHECK_THROW(invalid.fromXMLString("<JMI><Setup><Parameter>x</Parameter></Setup></JMI>"),
                      QuantLib::Error);
}

BOOST_AUTO_TEST_CASE(testRun) {
    BOOST_TEST_MESSAGE("Testing an application run...");

    clearOutput(TEST_OUTPUT);
    {
        JMIApp app(parameters("jsda.csv"));
        BOOST_CHECK(!app.aggregator());
        BOOST_REQUIRE(app.run());
        BOOST_CHECK(app.getRunTime() >= 0.0);

        BOOST_REQUIRE(app.aggregator());
        QuantLib::ext::shared_ptr<const MetricsSnapshot> s = app.aggregator()->currentSnapshot();
        BOOST_CHECK_EQUAL(s->dataVersion(), "2026-01-16");
        BOOST_CHECK_EQUAL(s->marketDate(), Date(16, January, 2026));
        BOOST_CHECK_EQUAL(s->rateResult().meetingDate, Date(23, January, 2026));
        BOOST_CHECK_EQUAL(s->rateResult().daysToMeeting, 7);
        BOOST_CHECK_EQUAL(s->rateResult().daysPost, 24);
        BOOST_CHECK_CLOSE(s->rateResult().pHike() + s->rateResult().pCut() + s->rateResult().pNoChange(), 1.0,
                          1.0e-10);
        BOOST_CHECK_EQUAL(s->creditProfiles().size(), 2U);
        BOOST_CHECK_EQUAL(s->oisCurve().size(), 6U);
        BOOST_CHECK_EQUAL(s->governmentCurve().size(), 7U);

        // a second run on the same files publishes equal metrics
        BOOST_REQUIRE(app.run());
        BOOST_CHECK(app.aggregator()->currentSnapshot()->sameMetrics(*s));
        BOOST_CHECK_EQUAL(app.aggregator()->snapshot("2026-01-16"), app.aggregator()->currentSnapshot());
    }

    BOOST_CHECK_EQUAL(readLines(TEST_OUTPUT_FILE("rate_probabilities.csv")).size(), 4U);
    vector<string> credit = readLines(TEST_OUTPUT_FILE("credit_profiles.csv"));
    BOOST_REQUIRE_EQUAL(credit.size(), 3U);
    BOOST_CHECK(credit[0].find("PD_3Y") != string::npos);
    BOOST_CHECK(credit[1].find("ソフトバンクグループ") != string::npos);
    vector<string> curves = readLines(TEST_OUTPUT_FILE("curves.csv"));
    BOOST_REQUIRE_EQUAL(curves.size(), 14U);
    BOOST_CHECK_EQUAL(curves[1].substr(0, 7), "OIS,1D,");
    BOOST_CHECK_EQUAL(curves[13].substr(0, 8), "JGB,10Y,");
    BOOST_CHECK(exists(TEST_OUTPUT_FILE_PATH("metrics.json")));
    BOOST_CHECK(!exists(TEST_OUTPUT_FILE_PATH("snapshot.json")));
    BOOST_CHECK(logContains("JMI done."));
}

BOOST_AUTO_TEST_CASE(testFailingRun) {
    BOOST_TEST_MESSAGE("Testing an application run with missing input...");

    clearOutput(TEST_OUTPUT);
    {
        JMIApp app(parameters("missing.csv"));
        BOOST_CHECK(!app.run());
        BOOST_CHECK(!app.aggregator()->hasSnapshot());
    }
    BOOST_CHECK(!exists(TEST_OUTPUT_FILE_PATH("rate_probabilities.csv")));
    BOOST_CHECK(logContains("StructuredMessage"));
    BOOST_CHECK(logContains("JMIApp::run()"));
    clearOutput(TEST_OUTPUT);
}

BOOST_AUTO_TEST_CASE(testNoParameters) {
    BOOST_TEST_MESSAGE("Testing an application without parameters...");
    BOOST_CHECK_THROW(JMIApp(nullptr), QuantLib::Error);
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

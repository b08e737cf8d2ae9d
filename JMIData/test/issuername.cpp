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
#include <jmid/marketdata/issuername.hpp>
#include <jmit/toplevelfixture.hpp>

using namespace boost::unit_test_framework;
using namespace jmi::data;
using std::string;

namespace {

struct test_issuer_data {
    const char* bondName;
    const char* issuer;
};

// bond names as they appear in the JSDA reference price files
static struct test_issuer_data issuer_data[] = {
    {"ソフトバンクグループ５５", "ソフトバンクグループ"},
    {"ソフトバンクグループ55", "ソフトバンクグループ"},
    {"トヨタ自動車　１２", "トヨタ自動車"},
    {"トヨタ自動車 12", "トヨタ自動車"},
    {"ＮＴＴ１０２", "NTT"},
    {"三井住友フィナンシャルグループ劣５", "三井住友フィナンシャルグループ"},
    {"東京センチュリ-2", "東京センチュリー"},
    {"ABC-DEF3", "ABC-DEF"},
    {"  日本電信電話  ", "日本電信電話"},
    {"ＪＦＥホールディングス", "JFEホールディングス"}};

} // namespace

BOOST_FIXTURE_TEST_SUITE(JMIDataTestSuite, jmi::test::TopLevelFixture)

BOOST_AUTO_TEST_SUITE(IssuerNameTests)

BOOST_AUTO_TEST_CASE(testExtractIssuer) {
    BOOST_TEST_MESSAGE("Testing issuer extraction from bond names...");

    for (const auto& d : issuer_data) {
        string issuer = extractIssuer(d.bondName);
        BOOST_TEST_MESSAGE(d.bondName << " -> " << issuer);
        BOOST_CHECK_EQUAL(issuer, string(d.issuer));
    }
}

BOOST_AUTO_TEST_CASE(testSeriesNumbersGiveSameIssuer) {
    BOOST_TEST_MESSAGE("Testing that bonds of one issuer map to one issuer id...");

    BOOST_CHECK_EQUAL(extractIssuer("ソフトバンクグループ５５"), extractIssuer("ソフトバンクグループ６１"));
    BOOST_CHECK_EQUAL(extractIssuer("ソフトバンクグループ５５"), extractIssuer("ソフトバンクグループ 61"));
}

BOOST_AUTO_TEST_CASE(testFoldFullWidth) {
    BOOST_TEST_MESSAGE("Testing full-width folding...");

    BOOST_CHECK_EQUAL(foldFullWidth("ＡＢＣ１２３"), "ABC123");
    BOOST_CHECK_EQUAL(foldFullWidth("Ａ　Ｂ"), "A B");
    BOOST_CHECK_EQUAL(foldFullWidth("（株）"), "(株)");
    // katakana and kanji are left alone
    BOOST_CHECK_EQUAL(foldFullWidth("トヨタ自動車"), "トヨタ自動車");
    BOOST_CHECK_EQUAL(foldFullWidth(""), "");
}

BOOST_AUTO_TEST_SUITE_END()

BOOST_AUTO_TEST_SUITE_END()

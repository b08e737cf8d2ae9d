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

#include <jmid/marketdata/csvloader.hpp>
#include <jmid/utilities/log.hpp>
#include <jmid/utilities/parsers.hpp>
#include <jmid/utilities/to_string.hpp>

#include <boost/algorithm/string.hpp>
#include <boost/locale/encoding.hpp>
#include <ql/errors.hpp>

#include <fstream>

using namespace std;
using QuantLib::Date;
using QuantLib::Real;
using QuantLib::Size;

namespace jmi {
namespace data {

namespace {
void cleanToken(string& token) { boost::trim_if(token, boost::is_any_of(" \t\r\"")); }

// files saved by spreadsheet tools may start with a UTF-8 byte order mark
void stripBom(string& line) {
    if (boost::starts_with(line, "\xEF\xBB\xBF"))
        line.erase(0, 3);
}

bool isUtf8(const string& encoding) { return boost::iequals(encoding, "UTF-8") || boost::iequals(encoding, "UTF8"); }
} // namespace

CSVLoader::CSVLoader(const string& oisFilename, const string& bondFilename, const Date& sourceDate,
                     const string& bondFileEncoding) {
    data_.sourceDate = sourceDate;

    loadOisFile(oisFilename);
    LOG("CSVLoader loaded " << data_.oisQuotes.size() << " OIS quotes");

    if (!bondFilename.empty()) {
        loadBondFile(bondFilename, bondFileEncoding);
        LOG("CSVLoader loaded " << data_.bondRecords.size() << " bond records");
    }

    if (data_.sourceDate == Date() && !data_.bondRecords.empty())
        data_.sourceDate = data_.bondRecords.front().tradeDate;
    QL_REQUIRE(data_.sourceDate != Date(), "CSVLoader: no source date given and none found in " << bondFilename);

    LOG("CSVLoader complete, source date " << to_string(data_.sourceDate));
}

void CSVLoader::loadOisFile(const string& filename) {
    LOG("CSVLoader loading OIS quotes from " << filename);

    ifstream file;
    file.open(filename.c_str());
    QL_REQUIRE(file.is_open(), "error opening file " << filename);

    bool header = true;
    while (!file.eof()) {
        string line;
        getline(file, line);
        stripBom(line);
        boost::trim(line);
        // skip blank and comment lines
        if (line.empty() || line[0] == '#')
            continue;

        vector<string> tokens;
        boost::split(tokens, line, boost::is_any_of(",;\t"), boost::token_compress_off);
        for (auto& t : tokens)
            cleanToken(t);
        QL_REQUIRE(tokens.size() == 2, "Invalid OIS line, 2 tokens expected: " << line);

        if (header) {
            header = false;
            if (boost::iequals(tokens[0], "tenor"))
                continue;
        }
        data_.oisQuotes.push_back(RawOisQuote{tokens[0], parseReal(tokens[1])});
        TLOG("Added OIS quote " << tokens[0] << " " << tokens[1]);
    }
    file.close();
}

void CSVLoader::loadBondFile(const string& filename, const string& encoding) {
    LOG("CSVLoader loading bond records from " << filename << " (" << encoding << ")");
    bool convert = !isUtf8(encoding);

    ifstream file;
    file.open(filename.c_str());
    QL_REQUIRE(file.is_open(), "error opening file " << filename);

    Size skipped = 0, lineNumber = 0;
    while (!file.eof()) {
        string line;
        getline(file, line);
        ++lineNumber;
        if (convert) {
            try {
                line = boost::locale::conv::to_utf<char>(line, encoding, boost::locale::conv::stop);
            } catch (const boost::locale::conv::conversion_error&) {
                QL_FAIL("CSVLoader: line " << lineNumber << " of " << filename << " is not valid " << encoding);
            } catch (const boost::locale::conv::invalid_charset_error& e) {
                QL_FAIL("CSVLoader: unsupported bond file encoding " << encoding << ": " << e.what());
            }
        }
        stripBom(line);
        boost::trim(line);
        if (line.empty() || line[0] == '#')
            continue;

        vector<string> tokens;
        boost::split(tokens, line, boost::is_any_of(","), boost::token_compress_off);
        for (auto& t : tokens)
            cleanToken(t);
        QL_REQUIRE(tokens.size() >= 7, "Invalid JSDA line, at least 7 tokens expected: " << line);

        Real yield;
        if (!tryParseReal(tokens[6], yield) || yield >= missingYield) {
            DLOG("Skipped bond record " << tokens[2] << " (" << tokens[3] << "), no yield");
            ++skipped;
            continue;
        }

        RawBondRecord record;
        record.tradeDate = parseDate(tokens[0]);
        record.category = parseInteger(tokens[1]);
        record.issueCode = tokens[2];
        record.name = tokens[3];
        record.maturity = parseDate(tokens[4]);
        Real coupon;
        record.coupon = tryParseReal(tokens[5], coupon) ? coupon : 0.0;
        record.yield = yield;
        data_.bondRecords.push_back(record);
        TLOG("Added bond record " << record.issueCode << " " << record.name);
    }
    file.close();
    LOG("CSVLoader completed processing " << filename << ", skipped " << skipped << " records without yield");
}

} // namespace data
} // namespace jmi

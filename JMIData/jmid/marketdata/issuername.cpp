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

#include <jmid/marketdata/issuername.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <boost/regex.hpp>

namespace jmi {
namespace data {

namespace {
// full-width digits are U+FF10 to U+FF19, i.e. EF BC 90 to EF BC 99 in UTF-8, U+3000 is the ideographic space
const boost::regex trailingSeriesNumber("(?:[ \\t]|\\xE3\\x80\\x80)*"
                                        "(?:[0-9]|\\xEF\\xBC[\\x90\\x91\\x92\\x93\\x94\\x95\\x96\\x97\\x98\\x99])+$");
const boost::regex hyphenAfterNonAlnum("(?<=[^0-9A-Za-z])-");
const boost::regex trailingSubordinated("\xE5\x8A\xA3$"); // 劣
const std::string longVowelMark = "\xE3\x83\xBC";         // ー
} // namespace

std::string foldFullWidth(const std::string& s) {
    std::string res;
    res.reserve(s.size());
    for (std::size_t i = 0; i < s.size(); ++i) {
        unsigned char c0 = static_cast<unsigned char>(s[i]);
        if (i + 2 < s.size()) {
            unsigned char c1 = static_cast<unsigned char>(s[i + 1]);
            unsigned char c2 = static_cast<unsigned char>(s[i + 2]);
            if (c0 == 0xEF && (c1 == 0xBC || c1 == 0xBD)) {
                unsigned cp = 0xF000 | ((c1 & 0x3F) << 6) | (c2 & 0x3F);
                if (cp >= 0xFF01 && cp <= 0xFF5E) {
                    res.push_back(static_cast<char>(cp - 0xFEE0));
                    i += 2;
                    continue;
                }
            } else if (c0 == 0xE3 && c1 == 0x80 && c2 == 0x80) {
                res.push_back(' ');
                i += 2;
                continue;
            }
        }
        res.push_back(s[i]);
    }
    return res;
}

std::string extractIssuer(const std::string& bondName) {
    std::string s = boost::regex_replace(bondName, trailingSeriesNumber, "");
    s = boost::regex_replace(s, hyphenAfterNonAlnum, longVowelMark);
    s = boost::regex_replace(s, trailingSubordinated, "");
    return boost::trim_copy(foldFullWidth(s));
}

} // namespace data
} // namespace jmi

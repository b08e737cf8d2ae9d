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

/*! \file jmid/marketdata/issuername.hpp
    \brief Issuer names from JSDA bond names
    \ingroup marketdata
*/

#pragma once

#include <string>

namespace jmi {
namespace data {

//! Extract the issuer from a JSDA bond name, e.g. "ソフトバンクグループ５５" gives "ソフトバンクグループ"
/*! The following rules are applied in order
    - a trailing series number (ASCII or full-width digits, optionally preceded by white space) is removed
    - a hyphen following a character that is not an ASCII letter or digit becomes the long vowel mark ー
    - a trailing subordination marker 劣 is removed
    - the result is trimmed and full-width ASCII letters, digits, punctuation and the ideographic space are
      folded to their half-width forms

    The input is expected to be UTF-8.
    \ingroup marketdata
*/
std::string extractIssuer(const std::string& bondName);

//! Fold full-width ASCII (U+FF01 to U+FF5E) and the ideographic space (U+3000) in a UTF-8 string to ASCII
std::string foldFullWidth(const std::string& s);

} // namespace data
} // namespace jmi

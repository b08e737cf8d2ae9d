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

/*! \file jmid/configuration/marketdataconfig.hpp
    \brief Class for holding the market data conventions
    \ingroup configuration
*/

#pragma once

#include <jmid/utilities/xmlutils.hpp>

#include <ql/types.hpp>
#include <set>

namespace jmi {
namespace data {

/*! Serializable market data conventions
    - QuotesInPercent: raw OIS rates and bond yields are quoted in percent (default true)
    - CorporateCategories: JSDA categories of the corporate bonds, comma separated (default 40)
    - GovernmentMarkers: a bond whose name contains one of these is a government bond
      (default 国庫短期証券 and 国債)
    - BondFileEncoding: character set of the JSDA bond file, converted to UTF-8 on load (default CP932)
    \ingroup configuration
*/
class MarketDataConfig : public XMLSerializable {
public:
    //! Default constructor with the JSDA conventions
    MarketDataConfig();
    MarketDataConfig(bool quotesInPercent, const std::set<QuantLib::Integer>& corporateCategories,
                     const std::vector<std::string>& governmentMarkers,
                     const std::string& bondFileEncoding = "CP932");

    //! \name XMLSerializable interface
    //@{
    void fromXML(const XMLNode& node) override;
    XMLNode toXML() const override;
    //@}

    //! \name Inspectors
    //@{
    bool quotesInPercent() const { return quotesInPercent_; }
    const std::set<QuantLib::Integer>& corporateCategories() const { return corporateCategories_; }
    const std::vector<std::string>& governmentMarkers() const { return governmentMarkers_; }
    const std::string& bondFileEncoding() const { return bondFileEncoding_; }
    //@}

    //! Factor converting a raw quote to decimal form
    QuantLib::Real quoteFactor() const { return quotesInPercent_ ? 0.01 : 1.0; }

private:
    bool quotesInPercent_;
    std::set<QuantLib::Integer> corporateCategories_;
    std::vector<std::string> governmentMarkers_;
    std::string bondFileEncoding_;
};

} // namespace data
} // namespace jmi

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

#include <jmid/configuration/marketdataconfig.hpp>
#include <jmid/utilities/parsers.hpp>

#include <ql/errors.hpp>

namespace jmi {
namespace data {

MarketDataConfig::MarketDataConfig()
    : quotesInPercent_(true), corporateCategories_({40}), governmentMarkers_({"国庫短期証券", "国債"}),
      bondFileEncoding_("CP932") {}

MarketDataConfig::MarketDataConfig(bool quotesInPercent, const std::set<QuantLib::Integer>& corporateCategories,
                                   const std::vector<std::string>& governmentMarkers,
                                   const std::string& bondFileEncoding)
    : quotesInPercent_(quotesInPercent), corporateCategories_(corporateCategories),
      governmentMarkers_(governmentMarkers), bondFileEncoding_(bondFileEncoding) {}

void MarketDataConfig::fromXML(const XMLNode& node) {
    XMLUtils::checkNode(node, "MarketData");

    quotesInPercent_ = XMLUtils::getChildValueAsBool(node, "QuotesInPercent", false, true);

    corporateCategories_ = {40};
    if (XMLUtils::getChildNode(node, "CorporateCategories")) {
        corporateCategories_.clear();
        for (const auto& c : parseListOfValues(XMLUtils::getChildValue(node, "CorporateCategories")))
            corporateCategories_.insert(parseInteger(c));
    }

    governmentMarkers_ = {"国庫短期証券", "国債"};
    if (XMLUtils::getChildNode(node, "GovernmentMarkers")) {
        governmentMarkers_ = XMLUtils::getChildrenValues(node, "GovernmentMarkers", "Marker");
        QL_REQUIRE(!governmentMarkers_.empty(), "MarketDataConfig: GovernmentMarkers must contain a Marker");
    }

    bondFileEncoding_ = XMLUtils::getChildValue(node, "BondFileEncoding", false, "CP932");
}

XMLNode MarketDataConfig::toXML() const {
    XMLNode node = XMLUtils::makeNode("MarketData");
    XMLUtils::addChild(node, "QuotesInPercent", quotesInPercent_);
    std::string categories;
    for (auto c : corporateCategories_)
        categories += (categories.empty() ? "" : ",") + std::to_string(c);
    XMLUtils::addChild(node, "CorporateCategories", categories);
    XMLUtils::addChildren(node, "GovernmentMarkers", "Marker", governmentMarkers_);
    XMLUtils::addChild(node, "BondFileEncoding", bondFileEncoding_);
    return node;
}

} // namespace data
} // namespace jmi

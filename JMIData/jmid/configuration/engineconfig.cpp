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

#include <jmid/configuration/engineconfig.hpp>
#include <jmid/utilities/log.hpp>

namespace jmi {
namespace data {

void EngineConfig::fromXML(const XMLNode& node) {
    XMLUtils::checkNode(node, "JMIConfig");

    marketDataConfig_ = MarketDataConfig();
    if (const XMLNode* n = XMLUtils::getChildNode(node, "MarketData"))
        marketDataConfig_.fromXML(*n);

    rateProbabilityConfig_ = RateProbabilityConfig();
    if (const XMLNode* n = XMLUtils::getChildNode(node, "RateProbability"))
        rateProbabilityConfig_.fromXML(*n);

    creditRiskConfig_ = CreditRiskConfig();
    if (const XMLNode* n = XMLUtils::getChildNode(node, "CreditRisk"))
        creditRiskConfig_.fromXML(*n);

    meetingCalendar_ = MeetingCalendar();
    if (const XMLNode* n = XMLUtils::getChildNode(node, "MeetingCalendar"))
        meetingCalendar_.fromXML(*n);
    else
        WLOG("EngineConfig: no MeetingCalendar given, meetings must come with the market data");

    DLOG("EngineConfig: " << meetingCalendar_.dates().size() << " policy meetings, recovery rate "
                          << creditRiskConfig_.recoveryRate());
}

XMLNode EngineConfig::toXML() const {
    XMLNode node = XMLUtils::makeNode("JMIConfig");
    XMLUtils::appendNode(node, marketDataConfig_.toXML());
    XMLUtils::appendNode(node, rateProbabilityConfig_.toXML());
    XMLUtils::appendNode(node, creditRiskConfig_.toXML());
    XMLUtils::appendNode(node, meetingCalendar_.toXML());
    return node;
}

} // namespace data
} // namespace jmi

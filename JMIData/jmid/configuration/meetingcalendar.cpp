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

#include <jmid/configuration/meetingcalendar.hpp>
#include <jmid/utilities/parsers.hpp>
#include <jmid/utilities/to_string.hpp>

#include <algorithm>

namespace jmi {
namespace data {

MeetingCalendar::MeetingCalendar(const std::vector<QuantLib::Date>& dates) : dates_(dates) {
    std::sort(dates_.begin(), dates_.end());
    dates_.erase(std::unique(dates_.begin(), dates_.end()), dates_.end());
}

void MeetingCalendar::fromXML(const XMLNode& node) {
    XMLUtils::checkNode(node, "MeetingCalendar");
    dates_.clear();
    for (const XMLNode* child : XMLUtils::getChildrenNodes(node, "Meeting"))
        dates_.push_back(parseDate(XMLUtils::getNodeValue(*child)));
    std::sort(dates_.begin(), dates_.end());
    dates_.erase(std::unique(dates_.begin(), dates_.end()), dates_.end());
}

XMLNode MeetingCalendar::toXML() const {
    XMLNode node = XMLUtils::makeNode("MeetingCalendar");
    for (const auto& d : dates_)
        XMLUtils::addChild(node, "Meeting", to_string(d));
    return node;
}

QuantLib::Date MeetingCalendar::nextMeeting(const QuantLib::Date& asof) const {
    auto it = std::lower_bound(dates_.begin(), dates_.end(), asof);
    return it == dates_.end() ? QuantLib::Date() : *it;
}

} // namespace data
} // namespace jmi

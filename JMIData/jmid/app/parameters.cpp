/*
 Copyright (C) 2016 Quaternion Risk Management Ltd
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

#include <jmid/app/parameters.hpp>

#include <jmid/utilities/log.hpp>

#include <ql/errors.hpp>

using std::string;
using std::vector;

namespace jmi {
namespace data {

namespace {
// group names as used in the file and their keys in data_
const vector<std::pair<string, string>> groups = {{"Setup", "setup"}, {"Logging", "logging"}, {"Output", "output"}};
} // namespace

bool Parameters::hasGroup(const string& groupName) const { return (data_.find(groupName) != data_.end()); }

bool Parameters::has(const string& groupName, const string& paramName) const {
    QL_REQUIRE(hasGroup(groupName), "param group '" << groupName << "' not found");
    auto it = data_.find(groupName);
    return (it->second.find(paramName) != it->second.end());
}

string Parameters::get(const string& groupName, const string& paramName, bool fail) const {
    if (fail) {
        QL_REQUIRE(has(groupName, paramName), "parameter " << paramName << " not found in param group " << groupName);
        auto it = data_.find(groupName);
        return it->second.find(paramName)->second;
    } else {
        if (!hasGroup(groupName) || !has(groupName, paramName))
            return "";
        else {
            auto it = data_.find(groupName);
            return it->second.find(paramName)->second;
        }
    }
}

const map<string, string>& Parameters::data(const string& groupName) const {
    auto it = data_.find(groupName);
    QL_REQUIRE(it != data_.end(), "param group '" << groupName << "' not found");
    return it->second;
}

void Parameters::fromFile(const string& fileName) {
    LOG("load JMI configuration from " << fileName);
    XMLDocument doc(fileName);
    fromXML(doc.getFirstNode("JMI"));
    LOG("load JMI configuration from " << fileName << " done.");
}

void Parameters::clear() { data_.clear(); }

void Parameters::fromXML(const XMLNode& node) {
    XMLUtils::checkNode(node, "JMI");
    clear();
    QL_REQUIRE(XMLUtils::getChildNode(node, "Setup"), "node Setup not found in parameter file");

    for (const auto& g : groups) {
        const XMLNode* groupNode = XMLUtils::getChildNode(node, g.first);
        if (!groupNode)
            continue;
        map<string, string> groupMap;
        for (const XMLNode* child : XMLUtils::getChildrenNodes(*groupNode, "Parameter")) {
            string key = XMLUtils::getAttribute(*child, "name");
            QL_REQUIRE(!key.empty(), "Parameter without name in group " << g.first);
            groupMap[key] = XMLUtils::getNodeValue(*child);
        }
        data_[g.second] = groupMap;
    }
}

XMLNode Parameters::toXML() const {
    XMLNode node = XMLUtils::makeNode("JMI");
    for (const auto& g : groups) {
        auto it = data_.find(g.second);
        if (it == data_.end())
            continue;
        XMLNode groupNode = XMLUtils::makeNode(g.first);
        for (const auto& p : it->second) {
            XMLNode paramNode = XMLUtils::makeNode("Parameter", p.second);
            XMLUtils::addAttribute(paramNode, "name", p.first);
            XMLUtils::appendNode(groupNode, paramNode);
        }
        XMLUtils::appendNode(node, groupNode);
    }
    return node;
}

void Parameters::log() {
    LOG("Parameters:");
    for (auto p : data_)
        for (auto pp : p.second)
            LOG("group = " << p.first << " : " << pp.first << " = " << pp.second);
}
} // namespace data
} // namespace jmi

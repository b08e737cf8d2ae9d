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

#include <jmid/utilities/parsers.hpp>
#include <jmid/utilities/xmlutils.hpp>

#include <boost/algorithm/string/trim.hpp>
#include <boost/property_tree/xml_parser.hpp>
#include <ql/errors.hpp>

#include <iomanip>
#include <sstream>

using boost::property_tree::ptree;
namespace xml_parser = boost::property_tree::xml_parser;

namespace jmi {
namespace data {

namespace {
const string attributeKey = "<xmlattr>";
const string commentKey = "<xmlcomment>";

bool isElement(const XMLNode& n) { return n.first != attributeKey && n.first != commentKey; }

string realToString(Real value) {
    std::ostringstream oss;
    oss << std::setprecision(16) << value;
    return oss.str();
}
} // namespace

XMLDocument::XMLDocument() {}

XMLDocument::XMLDocument(const string& fileName) {
    try {
        xml_parser::read_xml(fileName, root_, xml_parser::trim_whitespace | xml_parser::no_comments);
    } catch (const xml_parser::xml_parser_error& e) {
        QL_FAIL("error parsing xml file " << fileName << ": " << e.what());
    }
}

void XMLDocument::fromXMLString(const string& xmlString) {
    std::istringstream iss(xmlString);
    root_.clear();
    try {
        xml_parser::read_xml(iss, root_, xml_parser::trim_whitespace | xml_parser::no_comments);
    } catch (const xml_parser::xml_parser_error& e) {
        QL_FAIL("error parsing xml string: " << e.what());
    }
}

void XMLDocument::toFile(const string& fileName) const {
    xml_parser::write_xml(fileName, root_, std::locale(), xml_parser::xml_writer_make_settings<string>(' ', 2));
}

string XMLDocument::toString() const {
    std::ostringstream oss;
    xml_parser::write_xml(oss, root_, xml_parser::xml_writer_make_settings<string>(' ', 2));
    return oss.str();
}

const XMLNode& XMLDocument::getFirstNode(const string& name) const {
    for (const auto& n : root_) {
        if (isElement(n) && (name.empty() || n.first == name))
            return n;
    }
    QL_FAIL("XMLDocument: no top level node " << (name.empty() ? string("at all") : name) << " found");
}

void XMLDocument::appendNode(const XMLNode& node) { root_.push_back(node); }

void XMLSerializable::fromFile(const string& filename) {
    XMLDocument doc(filename);
    fromXML(doc.getFirstNode(""));
}

void XMLSerializable::toFile(const string& filename) const {
    XMLDocument doc;
    doc.appendNode(toXML());
    doc.toFile(filename);
}

void XMLSerializable::fromXMLString(const string& xml) {
    XMLDocument doc;
    doc.fromXMLString(xml);
    fromXML(doc.getFirstNode(""));
}

string XMLSerializable::toXMLString() const {
    XMLDocument doc;
    doc.appendNode(toXML());
    return doc.toString();
}

void XMLUtils::checkNode(const XMLNode& node, const string& expectedName) {
    QL_REQUIRE(node.first == expectedName,
               "XML Node name " << node.first << " does not match expected name " << expectedName);
}

XMLNode XMLUtils::makeNode(const string& name, const string& value) { return XMLNode(name, ptree(value)); }

const string& XMLUtils::getNodeName(const XMLNode& node) { return node.first; }

string XMLUtils::getNodeValue(const XMLNode& node) { return boost::trim_copy(node.second.data()); }

string XMLUtils::getAttribute(const XMLNode& node, const string& attrName) {
    return boost::trim_copy(node.second.get<string>(attributeKey + "." + attrName, ""));
}

const XMLNode* XMLUtils::getChildNode(const XMLNode& node, const string& name) {
    for (const auto& child : node.second) {
        if (isElement(child) && (name.empty() || child.first == name))
            return &child;
    }
    return nullptr;
}

vector<const XMLNode*> XMLUtils::getChildrenNodes(const XMLNode& node, const string& name) {
    vector<const XMLNode*> res;
    for (const auto& child : node.second) {
        if (isElement(child) && (name.empty() || child.first == name))
            res.push_back(&child);
    }
    return res;
}

string XMLUtils::getChildValue(const XMLNode& node, const string& name, bool mandatory, const string& defaultValue) {
    const XMLNode* child = getChildNode(node, name);
    if (child == nullptr) {
        QL_REQUIRE(!mandatory, "Error: mandatory child node " << name << " not found in " << node.first);
        return defaultValue;
    }
    return getNodeValue(*child);
}

Real XMLUtils::getChildValueAsDouble(const XMLNode& node, const string& name, bool mandatory, Real defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseReal(s);
}

int XMLUtils::getChildValueAsInt(const XMLNode& node, const string& name, bool mandatory, int defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseInteger(s);
}

bool XMLUtils::getChildValueAsBool(const XMLNode& node, const string& name, bool mandatory, bool defaultValue) {
    string s = getChildValue(node, name, mandatory);
    return s.empty() ? defaultValue : parseBool(s);
}

vector<string> XMLUtils::getChildrenValues(const XMLNode& parent, const string& names, const string& name,
                                           bool mandatory) {
    vector<string> vec;
    const XMLNode* node = getChildNode(parent, names);
    if (mandatory) {
        QL_REQUIRE(node, "Error: mandatory node " << names << " not found in " << parent.first);
    }
    if (node) {
        for (const XMLNode* child : getChildrenNodes(*node, name))
            vec.push_back(getNodeValue(*child));
    }
    return vec;
}

vector<Real> XMLUtils::getChildrenValuesAsDoublesCompact(const XMLNode& node, const string& name, bool mandatory) {
    vector<Real> vec;
    for (const auto& s : parseListOfValues(getChildValue(node, name, mandatory)))
        vec.push_back(parseReal(s));
    return vec;
}

void XMLUtils::addChild(XMLNode& node, const string& name, const string& value) {
    node.second.push_back(makeNode(name, value));
}

void XMLUtils::addChild(XMLNode& node, const string& name, const char* value) {
    addChild(node, name, string(value));
}

void XMLUtils::addChild(XMLNode& node, const string& name, Real value) { addChild(node, name, realToString(value)); }

void XMLUtils::addChild(XMLNode& node, const string& name, int value) {
    addChild(node, name, std::to_string(value));
}

void XMLUtils::addChild(XMLNode& node, const string& name, bool value) {
    addChild(node, name, string(value ? "true" : "false"));
}

void XMLUtils::addChildren(XMLNode& node, const string& names, const string& name, const vector<string>& values) {
    XMLNode child = makeNode(names);
    for (const auto& v : values)
        addChild(child, name, v);
    appendNode(node, child);
}

void XMLUtils::addChildrenCompact(XMLNode& node, const string& name, const vector<Real>& values) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < values.size(); ++i)
        oss << (i == 0 ? "" : ",") << realToString(values[i]);
    addChild(node, name, oss.str());
}

void XMLUtils::addAttribute(XMLNode& node, const string& attrName, const string& attrValue) {
    node.second.put(attributeKey + "." + attrName, attrValue);
}

void XMLUtils::appendNode(XMLNode& parent, const XMLNode& child) { parent.second.push_back(child); }

} // namespace data
} // namespace jmi

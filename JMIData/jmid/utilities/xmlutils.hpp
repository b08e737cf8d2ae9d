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

/*! \file jmid/utilities/xmlutils.hpp
    \brief XML utility functions
    \ingroup utilities
*/

#pragma once

#include <boost/property_tree/ptree.hpp>
#include <ql/types.hpp>
#include <string>
#include <vector>

namespace jmi {
namespace data {
using QuantLib::Real;
using std::string;
using std::vector;

//! A named XML element, i.e. the element name paired with its content
typedef boost::property_tree::ptree::value_type XMLNode;

//! Small XML Document wrapper class.
/*! \ingroup utilities
 */
class XMLDocument {
public:
    //! create an empty doc.
    XMLDocument();
    //! load an xml doc from the given file
    explicit XMLDocument(const string& filename);

    //! load a document from a hard-coded string
    void fromXMLString(const string& xmlString);

    //! save the XML Document to the given file.
    void toFile(const string& filename) const;

    //! return the XML Document as a string.
    string toString() const;

    //! return the first top level node with the given name, or the first top level node if \p name is empty
    const XMLNode& getFirstNode(const string& name) const;

    //! append a top level node
    void appendNode(const XMLNode& node);

private:
    boost::property_tree::ptree root_;
};

//! Base class for all serializable classes
/*! \ingroup utilities
 */
class XMLSerializable {
public:
    virtual ~XMLSerializable() {}
    virtual void fromXML(const XMLNode& node) = 0;
    virtual XMLNode toXML() const = 0;

    void fromFile(const string& filename);
    void toFile(const string& filename) const;

    //! Parse from XML string
    void fromXMLString(const string& xml);
    //! Parse from XML string
    string toXMLString() const;
};

//! XML Utilities Class
/*! \ingroup utilities
 */
class XMLUtils {
public:
    // Validate that the node has the given name, throws if not
    static void checkNode(const XMLNode& node, const string& expectedName);

    static XMLNode makeNode(const string& name, const string& value = "");

    static const string& getNodeName(const XMLNode& node);
    static string getNodeValue(const XMLNode& node);
    static string getAttribute(const XMLNode& node, const string& attrName);

    //! Returns the first child with the given name, or \c nullptr if there is no such child
    static const XMLNode* getChildNode(const XMLNode& node, const string& name);
    //! Returns all children with the given name, or all element children if \p name is empty
    static vector<const XMLNode*> getChildrenNodes(const XMLNode& node, const string& name = "");

    // If mandatory == true, we throw if the node is not present, otherwise we return a default value
    static string getChildValue(const XMLNode& node, const string& name, bool mandatory = false,
                                const string& defaultValue = string());
    static Real getChildValueAsDouble(const XMLNode& node, const string& name, bool mandatory = false,
                                      Real defaultValue = 0.0);
    static int getChildValueAsInt(const XMLNode& node, const string& name, bool mandatory = false,
                                  int defaultValue = 0);
    static bool getChildValueAsBool(const XMLNode& node, const string& name, bool mandatory = false,
                                    bool defaultValue = true);

    //! Returns the values of all \p name children below the \p names child
    static vector<string> getChildrenValues(const XMLNode& node, const string& names, const string& name,
                                            bool mandatory = false);
    //! Returns the comma separated values of the \p name child
    static vector<Real> getChildrenValuesAsDoublesCompact(const XMLNode& node, const string& name,
                                                          bool mandatory = false);

    static void addChild(XMLNode& node, const string& name, const string& value);
    static void addChild(XMLNode& node, const string& name, const char* value);
    static void addChild(XMLNode& node, const string& name, Real value);
    static void addChild(XMLNode& node, const string& name, int value);
    static void addChild(XMLNode& node, const string& name, bool value);
    static void addChildren(XMLNode& node, const string& names, const string& name, const vector<string>& values);
    static void addChildrenCompact(XMLNode& node, const string& name, const vector<Real>& values);
    static void addAttribute(XMLNode& node, const string& attrName, const string& attrValue);
    static void appendNode(XMLNode& parent, const XMLNode& child);
};

} // namespace data
} // namespace jmi

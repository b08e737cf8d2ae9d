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

/*! \file jmid/app/parameters.hpp
    \brief Application setup read from the parameter file
    \ingroup app
*/

#pragma once

#include <map>
#include <vector>

#include <jmid/utilities/xmlutils.hpp>

namespace jmi {
namespace data {
using std::map;
using std::string;

//! Provides the input data and references to input files used in JMIApp
/*! The parameter file has a mandatory \c Setup group and optional \c Logging and \c Output groups, each a list of
    <tt>\<Parameter name="..."\>value\</Parameter\></tt> nodes below the root node \c JMI.
    \ingroup app
 */
class Parameters : public XMLSerializable {
public:
    Parameters() {}

    void clear();
    void fromFile(const string&);
    virtual void fromXML(const XMLNode& node) override;
    virtual XMLNode toXML() const override;

    bool hasGroup(const string& groupName) const;
    bool has(const string& groupName, const string& paramName) const;
    string get(const string& groupName, const string& paramName, bool fail = true) const;
    const map<string, string>& data(const string& groupName) const;

    void log();

private:
    map<string, map<string, string>> data_;
};
} // namespace data
} // namespace jmi

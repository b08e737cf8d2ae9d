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

/*! \file jmit/toplevelfixture.hpp
    \brief Fixture that can be used at top level
*/

#pragma once

#include <boost/test/unit_test.hpp>
#include <jmid/utilities/log.hpp>
#include <ql/settings.hpp>

using QuantLib::SavedSettings;

namespace jmi {
namespace test {

//! Top level fixture
class TopLevelFixture {
public:
    SavedSettings savedSettings;

    /*! Constructor
        Add things here that you want to happen at the start of every test case
    */
    TopLevelFixture() : logMask_(jmi::data::Log::instance().mask()), logEnabled_(jmi::data::Log::instance().enabled()) {}

    /*! Destructor
        Add things here that you want to happen after _every_ test case
    */
    virtual ~TopLevelFixture() {
        // Remove a buffer logger a test has registered and restore the log state
        if (jmi::data::Log::instance().hasLogger(jmi::data::BufferLogger::name))
            jmi::data::Log::instance().removeLogger(jmi::data::BufferLogger::name);
        jmi::data::Log::instance().setMask(logMask_);
        if (logEnabled_)
            jmi::data::Log::instance().switchOn();
        else
            jmi::data::Log::instance().switchOff();
    }

private:
    unsigned logMask_;
    bool logEnabled_;
};
} // namespace test
} // namespace jmi

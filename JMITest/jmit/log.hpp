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

/*! \file jmit/log.hpp
    \brief boost test logger
*/

#pragma once

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/test/unit_test.hpp>
#include <jmid/utilities/log.hpp>

namespace jmi {
namespace test {

//! BoostTest Logger
/*!
  This logger writes each log message out to the BOOST_TEST_MESSAGE.
  To view log messages run the unit tests with the flag "--log_level=test_suite"
  \ingroup utilities
  \see Log
 */
class BoostTestLogger : public jmi::data::Logger {
public:
    //! Constructor
    BoostTestLogger() : Logger("BoostTestLogger") {}
    //! The log callback
    virtual void log(unsigned, const std::string& msg) override { BOOST_TEST_MESSAGE(msg); }
};

//! Gets passed the command line arguments from a unit test suite
//! and sets up JMI logging if it is requested
/*!
    Specifying --jmi_log_mask on its own turns on logging with a default
    log mask of 255
    Optionally, you can specify the log mask using --jmi_log_mask=<mask>
    \ingroup utilities
*/
inline void setupTestLogging(int argc, char** argv) {

    for (int i = 1; i < argc; ++i) {

        // --jmi_log_mask indicates we want JMI logging
        if (boost::starts_with(argv[i], "--jmi_log_mask")) {

            // Check if mask is provided also (default is 255)
            unsigned int mask = 255;
            std::vector<std::string> strs;
            boost::split(strs, argv[i], boost::is_any_of("="));
            if (strs.size() > 1) {
                mask = boost::lexical_cast<unsigned int>(strs[1]);
            }

            // Set up logging
            jmi::data::Log::instance().removeAllLoggers();
            jmi::data::Log::instance().registerLogger(QuantLib::ext::make_shared<BoostTestLogger>());
            jmi::data::Log::instance().switchOn();
            jmi::data::Log::instance().setMask(mask);
        }
    }
}

} // namespace test
} // namespace jmi

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

/*! \file jmit/basedatapath.hpp
    \brief Parse base data path from the Boost test command line arguments
*/

#pragma once

#include <boost/algorithm/string.hpp>
#include <boost/filesystem.hpp>
#include <ql/errors.hpp>
#include <string>
#include <vector>

namespace jmi {
namespace test {

/*! Gets passed the command line arguments from a unit test suite
    and checks if a base data path has been provided

    Specify the base data path as --base_data_path. The base data path
    should have a child 'input' directory containing any input files for
    the tests. Any output from the tests will be added to child 'output'
    directory under this base data path.

    The default base data path is the working directory.
*/
inline std::string getBaseDataPath(int argc, char** argv) {

    std::string strPath = ".";

    // Check if a base data path has been provided in the command line arguments
    for (int i = 1; i < argc; ++i) {
        if (boost::starts_with(argv[i], "--base_data_path")) {
            std::vector<std::string> strs;
            boost::split(strs, argv[i], boost::is_any_of("="));
            if (strs.size() > 1) {
                strPath = strs[1];
            }
        }
    }

    // Test that we have a valid path
    boost::filesystem::path p(strPath);
    QL_REQUIRE(boost::filesystem::is_directory(p),
               "Test set up failed: the path '" << strPath << "' is not a directory");

    return strPath;
}

} // namespace test
} // namespace jmi

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

/*! \file jmit/fileutilities.hpp
    \brief File utilities for use in unit tests
*/

#pragma once

#include <boost/filesystem.hpp>
#include <boost/test/unit_test.hpp>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace {

// Use to remove the output directory when the suite exits
// Returns true if the operation completed without errors, otherwise false
inline bool clearOutput(const boost::filesystem::path& outputPath) {

    // If output path does not exist, nothing to do
    if (!boost::filesystem::exists(outputPath))
        return true;

    // If the output path exists, attempt to remove it
    try {
        boost::filesystem::remove_all(outputPath);
        return true;
    } catch (boost::filesystem::filesystem_error& err) {
        BOOST_TEST_MESSAGE("The attempt to remove the output path, " << outputPath << ", failed with error "
                                                                     << err.what());
        return false;
    }
}

// Read the non empty lines of a text file, an empty vector is returned if the file cannot be opened
inline std::vector<std::string> readLines(const std::string& filename) {
    std::vector<std::string> lines;
    std::ifstream f(filename);
    if (f.fail()) {
        BOOST_TEST_MESSAGE("Attempt to read file, " << filename << ", failed.");
        return lines;
    }
    std::string line;
    while (std::getline(f, line)) {
        if (!line.empty())
            lines.push_back(line);
    }
    return lines;
}

} // namespace

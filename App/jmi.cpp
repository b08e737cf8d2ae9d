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

#include <jmid/app/jmiapp.hpp>
#include <jmid/version.hpp>

#include <iostream>

using namespace std;
using namespace jmi::data;

int main(int argc, char** argv) {

    if (argc == 2 && (string(argv[1]) == "-v" || string(argv[1]) == "--version")) {
        cout << "JMI version " << JMI_VERSION << endl;
        exit(0);
    }

    if (argc != 2) {
        std::cout << endl << "usage: jmi path/to/jmi.xml" << endl << endl;
        return -1;
    }

    string inputFile(argv[1]);

    try {
        auto params = QuantLib::ext::make_shared<Parameters>();
        params->fromFile(inputFile);
        JMIApp jmi(params, true);
        return jmi.run() ? 0 : 1;
    } catch (const exception& e) {
        cout << endl << "an error occurred: " << e.what() << endl;
        return -1;
    }
}

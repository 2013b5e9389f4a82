/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

#include <lxd/app/lendvalapp.hpp>
#include <lxe/version.hpp>

#include <iostream>

using namespace std;
using namespace lend::data;

int main(int argc, char** argv) {

    if (argc == 2 && (string(argv[1]) == "-v" || string(argv[1]) == "--version")) {
        cout << "lendval version " << LEND_VALUATION_VERSION << endl;
        exit(0);
    }

    if (argc != 2) {
        std::cout << endl << "usage: lendval path/to/lendval.xml" << endl << endl;
        return -1;
    }

    string inputFile(argv[1]);

    try {
        auto params = QuantLib::ext::make_shared<ValuationParameters>();
        params->fromFile(inputFile);
        LendValApp app(params, true);
        app.run();
        return 0;
    } catch (const exception& e) {
        cout << endl << "an error occurred: " << e.what() << endl;
        return -1;
    }
}

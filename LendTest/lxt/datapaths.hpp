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

/*! \file lxt/datapaths.hpp
    \brief Location of the XML documents a test file reads
*/

#pragma once

#include <boost/filesystem.hpp>

#include <string>

// Set by the global fixture of the test suite
extern std::string basePath;

// Directory input/<test file stem> below the base data path
#define TEST_INPUT_PATH (boost::filesystem::path(basePath) / "input" / boost::filesystem::path(__FILE__).stem())

// Input file with the given name for the test file in which it is called
#define TEST_INPUT_FILE(filename) (TEST_INPUT_PATH / filename).string()

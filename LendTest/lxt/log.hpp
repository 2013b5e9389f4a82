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

/*! \file lxt/log.hpp
    \brief boost test logger
*/

#pragma once

#include <boost/algorithm/string.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/test/unit_test.hpp>
#include <lxd/utilities/log.hpp>

using lend::data::Logger;

namespace lend {
namespace test {

//! BoostTest Logger
/*!
  This logger writes each log message out to the BOOST_TEST_MESSAGE.
  To view log messages run the unit tests with the flag "--log_level=test_suite"
  \ingroup utilities
  \see Log
 */
class BoostTestLogger : public Logger {
public:
    //! Constructor
    BoostTestLogger() : Logger("BoostTestLogger") {}
    //! The log callback
    void log(unsigned, const std::string& msg) override { BOOST_TEST_MESSAGE(msg); }
};

//! Gets passed the command line arguments from a unit test suite
//! and sets up library logging if it is requested
/*!
    Specifying --lend_log_mask on its own turns on logging with a default
    log mask of 127
    Optionally, you can specify the log mask using --lend_log_mask=<mask>
    \ingroup utilities
*/
void setupTestLogging(int argc, char** argv) {

    for (int i = 1; i < argc; ++i) {

        // --lend_log_mask indicates we want library logging
        if (boost::starts_with(argv[i], "--lend_log_mask")) {

            // Check if mask is provided also (default is 127)
            unsigned int mask = 127;
            std::vector<std::string> strs;
            boost::split(strs, argv[i], boost::is_any_of("="));
            if (strs.size() > 1) {
                mask = boost::lexical_cast<unsigned int>(strs[1]);
            }

            // Set up logging
            lend::data::Log::instance().removeAllLoggers();
            lend::data::Log::instance().registerLogger(QuantLib::ext::make_shared<BoostTestLogger>());
            lend::data::Log::instance().switchOn();
            lend::data::Log::instance().setMask(mask);
        }
    }
}

} // namespace test
} // namespace lend

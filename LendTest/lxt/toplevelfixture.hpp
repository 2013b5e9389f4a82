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

/*! \file lxt/toplevelfixture.hpp
    \brief Fixture that can be used at top level
*/

#pragma once

#include <boost/test/unit_test.hpp>
#include <lxd/utilities/log.hpp>

namespace lend {
namespace test {

//! Top level fixture
/*! Test cases may switch logging on, change the mask or register a BufferLogger to inspect
    messages. The fixture puts the global Log back the way it found it.
*/
class TopLevelFixture {
public:
    /*! Constructor
        Add things here that you want to happen at the start of every test case
    */
    TopLevelFixture()
        : logEnabled_(lend::data::Log::instance().enabled()), logMask_(lend::data::Log::instance().mask()) {}

    /*! Destructor
        Add things here that you want to happen after _every_ test case
    */
    virtual ~TopLevelFixture() {
        lend::data::Log& log = lend::data::Log::instance();
        if (log.hasLogger(lend::data::BufferLogger::name))
            log.removeLogger(lend::data::BufferLogger::name);
        log.setMask(logMask_);
        if (logEnabled_)
            log.switchOn();
        else
            log.switchOff();
    }

private:
    bool logEnabled_;
    unsigned logMask_;
};

} // namespace test
} // namespace lend

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

/*! \file lxe/errors.hpp
    \brief Fatal valuation errors

    Two families of errors abort a valuation. A ContractViolation is raised when the
    caller hands in data the engine cannot value (unknown tier, currency mismatch,
    off-schedule maturity, maturity in the past, unsorted portfolio). An ArithmeticFault
    is raised when a fixed point or 256 bit computation leaves its range, or when a
    discount factor ends up above unity.

    Neither is meant to be caught below the top level call.

    \ingroup utilities
*/

#pragma once

#include <ql/errors.hpp>

#include <sstream>
#include <string>

namespace LendExt {

//! Inputs violate the contract of a valuation call
class ContractViolation : public QuantLib::Error {
public:
    ContractViolation(const std::string& file, long line, const std::string& functionName,
                      const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

//! Overflow, division by zero or a broken numerical invariant
class ArithmeticFault : public QuantLib::Error {
public:
    ArithmeticFault(const std::string& file, long line, const std::string& functionName,
                    const std::string& message = "")
        : QuantLib::Error(file, line, functionName, message) {}
};

} // namespace LendExt

/*! \def LXE_FAIL_CONTRACT
    \brief throw a LendExt::ContractViolation with the given message
*/
#define LXE_FAIL_CONTRACT(message)                                                                                     \
    do {                                                                                                               \
        std::ostringstream _lxe_msg_stream;                                                                            \
        _lxe_msg_stream << message;                                                                                    \
        throw LendExt::ContractViolation(__FILE__, __LINE__, QL_PRETTY_FUNCTION, _lxe_msg_stream.str());               \
    } while (false)

/*! \def LXE_FAIL_ARITHMETIC
    \brief throw a LendExt::ArithmeticFault with the given message
*/
#define LXE_FAIL_ARITHMETIC(message)                                                                                   \
    do {                                                                                                               \
        std::ostringstream _lxe_msg_stream;                                                                            \
        _lxe_msg_stream << message;                                                                                    \
        throw LendExt::ArithmeticFault(__FILE__, __LINE__, QL_PRETTY_FUNCTION, _lxe_msg_stream.str());                 \
    } while (false)

/*! \def LXE_REQUIRE_CONTRACT
    \brief throw a LendExt::ContractViolation if the given condition is not met
*/
#define LXE_REQUIRE_CONTRACT(condition, message)                                                                       \
    if (!(condition)) {                                                                                                \
        LXE_FAIL_CONTRACT(message);                                                                                    \
    } else

/*! \def LXE_REQUIRE_ARITHMETIC
    \brief throw a LendExt::ArithmeticFault if the given condition is not met
*/
#define LXE_REQUIRE_ARITHMETIC(condition, message)                                                                     \
    if (!(condition)) {                                                                                                \
        LXE_FAIL_ARITHMETIC(message);                                                                                  \
    } else
